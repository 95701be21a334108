#include <cerrno>
#include <cstdlib>
#include <execbox/errmsg.hh>
#include <execbox/file_manip.hh>
#include <execbox/logger.hh>
#include <execbox/macros/throw.hh>
#include <execbox/temporary_directory.hh>

TemporaryDirectory::TemporaryDirectory(std::string templ) {
    if (not templ.ends_with("XXXXXX")) {
        THROW("invalid template: ", templ);
    }
    if (mkdtemp(templ.data()) == nullptr) {
        THROW("mkdtemp()", errmsg());
    }
    char* abs_path = realpath(templ.c_str(), nullptr);
    if (abs_path == nullptr) {
        int errnum = errno;
        (void)remove_r(templ.c_str());
        THROW("realpath()", errmsg(errnum));
    }
    path_ = abs_path;
    free(abs_path); // NOLINT(cppcoreguidelines-no-malloc)
    path_ += '/';
}

// NOLINTNEXTLINE(performance-noexcept-move-constructor): it throws
TemporaryDirectory& TemporaryDirectory::operator=(TemporaryDirectory&& td) {
    if (exists() && remove_r(path_.c_str()) == -1) {
        THROW("remove_r() failed", errmsg());
    }
    path_ = std::exchange(td.path_, {});
    return *this;
}

TemporaryDirectory::~TemporaryDirectory() {
    if (exists() && remove_r(path_.c_str()) == -1) {
        errlog("Error: remove_r()", errmsg());
    }
}
