#include <cerrno>
#include <execbox/errmsg.hh>
#include <execbox/macros/throw.hh>
#include <execbox/random.hh>
#include <sys/random.h>

void fill_randomly(void* dest, size_t bytes) {
    auto* ptr = static_cast<char*>(dest);
    while (bytes > 0) {
        auto rc = getrandom(ptr, bytes, 0);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            THROW("getrandom()", errmsg());
        }
        ptr += rc;
        bytes -= static_cast<size_t>(rc);
    }
}

std::string random_hex_string(size_t len) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string res(len, '0');
    for (auto& c : res) {
        c = digits[get_random<int>(0, 15)];
    }
    return res;
}
