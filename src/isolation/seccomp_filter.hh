#pragma once

#include <execbox/file_descriptor.hh>
#include <execbox/limits.hh>

namespace execbox::isolation {

/**
 * @brief Builds the seccomp filter of the sandboxed processes
 * @details Denied (EPERM): leaving the process group or session, creating namespaces, mounting,
 *   tracing, loading kernel code and a few other host-level operations. If @p network is
 *   denied, creating a socket of any domain other than AF_UNIX fails with EACCES.
 *
 * @return memfd containing the filter (array of struct sock_filter)
 */
FileDescriptor build_seccomp_filter(NetworkPolicy network);

} // namespace execbox::isolation
