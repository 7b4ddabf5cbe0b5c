#pragma once

#include "runguard_options.hpp"

/**
 * Limit current process resources usage.
 */
void set_restrictions(const struct runguard_options &opt);

/**
 * Move current process into fresh user, network, IPC and UTS namespaces.
 *
 * Best effort: kernels with unprivileged user namespaces disabled
 * refuse this, the seccomp filter still denies socket creation then.
 *
 * @return true if the namespaces were created
 */
bool isolate_namespaces();

/**
 * Close every file descriptor above stderr, the command must not
 * inherit descriptors opened by the host process.
 */
void close_inherited_fds();

/**
 * Deny dangerous syscalls. Must be called last before exec.
 */
void set_seccomp(const struct runguard_options &opt);
