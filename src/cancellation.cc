#include <cstdint>
#include <execbox/cancellation.hh>
#include <execbox/errmsg.hh>
#include <execbox/macros/throw.hh>
#include <poll.h>
#include <sys/eventfd.h>

namespace execbox {

CancellationToken::CancellationToken()
: efd_{eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK)} {
    if (!efd_.is_open()) {
        THROW("eventfd()", errmsg());
    }
}

void CancellationToken::cancel() noexcept {
    uint64_t one = 1;
    // Fails only if the counter would overflow, then it is already set
    (void)write(efd_, &one, sizeof(one));
}

bool CancellationToken::is_cancelled() const noexcept {
    pollfd pfd = {.fd = efd_, .events = POLLIN, .revents = 0};
    return poll(&pfd, 1, 0) == 1 && (pfd.revents & POLLIN);
}

} // namespace execbox
