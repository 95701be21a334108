#include <cstring>
#include <execbox/concat_tostr.hh>
#include <execbox/si.hh>
#include <string_view>
#include <sys/wait.h>

namespace execbox {

std::optional<int> Si::exit_code() const noexcept {
    if (code == CLD_EXITED) {
        return status;
    }
    return std::nullopt;
}

std::optional<int> Si::killing_signal() const noexcept {
    if (code == CLD_KILLED or code == CLD_DUMPED) {
        return status;
    }
    return std::nullopt;
}

std::string Si::description() const {
    auto describe_signal = [signum = status](std::string_view what) {
        const char* name = sigabbrev_np(signum);
        const char* desc = sigdescr_np(signum);
        auto res = name ? concat_tostr(what, " SIG", name)
                        : concat_tostr(what, " with number ", signum);
        if (desc) {
            res += concat_tostr(" - ", desc);
        }
        return res;
    };
    switch (code) {
    case CLD_EXITED: return concat_tostr("exited with ", status);
    case CLD_KILLED: return describe_signal("killed by signal");
    case CLD_DUMPED: return describe_signal("killed and dumped by signal");
    case CLD_TRAPPED: return describe_signal("trapped by signal");
    case CLD_STOPPED: return describe_signal("stopped by signal");
    case CLD_CONTINUED: return describe_signal("continued by signal");
    }
    return concat_tostr("unable to describe (code ", code, ", status ", status, ')');
}

} // namespace execbox
