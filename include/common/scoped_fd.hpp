#pragma once

#include <unistd.h>

#include "common/scoped.hpp"

struct scoped_fd_traits {
    using value_type = int;

    static value_type invalid_value() {
        return -1;
    }

    static void free(value_type &value) {
        close(value);
    }
};

using scoped_fd = scoped_generic<scoped_fd_traits>;

/**
 * @brief 一对管道文件描述符，两端都设置了 O_CLOEXEC
 * 子进程通过 dup2 复制出来的描述符不会带有 O_CLOEXEC
 */
struct scoped_pipe {
    scoped_fd read_end;
    scoped_fd write_end;
};
