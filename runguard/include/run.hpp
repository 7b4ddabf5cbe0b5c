#pragma once

#include "runguard_options.hpp"

/**
 * @brief exit code when the sandbox could not be set up
 */
const int EXIT_SETUP_FAILURE = 125;

/**
 * @brief 在当前进程中建立沙箱并执行指定的程序
 * 1. 清理环境变量，只保留 PATH 和通过 --variable 指定的变量
 * 2. 通过 rlimit 限制 CPU time、地址空间、创建文件的大小，禁止 core dump
 * 3. 调用 setsid 将进程分离到独立的进程组，宿主可以通过 kill(-pid) 杀死整个进程组
 * 4. 切换工作路径
 * 5. 分离 USER、NET、IPC、UTS 命名空间（尽力而为）
 * 6. 关闭从宿主继承的文件描述符
 * 7. 加载 seccomp 过滤器，禁止网络、创建进程、调试、挂载等系统调用
 * 8. 调用 execvp 执行程序，进程号不变，宿主看到的子进程就是被执行的程序
 * @note 只有在出错时才会返回
 * @return EXIT_SETUP_FAILURE
 */
int runit(struct runguard_options opt);
