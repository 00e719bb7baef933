#pragma once

namespace codejudge {

/**
 * @brief 表示测试点或整个提交的评测结果
 */
enum class status {
    /**
     * @brief 用户程序本测试点输出和标准输出一致
     * 比较时只忽略输出首尾的空白字符
     */
    ACCEPTED = 0,

    /**
     * @brief 答案错误
     * 去掉首尾空白字符后输出和标准输出不一致，中间的空白字符差异也算答案错误
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 测试点没有标准输出，用户程序正常运行结束
     * 视为通过
     */
    EXECUTED = 2,

    /**
     * @brief 用户程序运行时间超出限制
     * 时间限制是时钟时间，包括编译型语言的编译时间
     */
    TIME_LIMIT_EXCEEDED = 3,

    /**
     * @brief 用户程序运行内存超限
     * 容器的内存限制是硬限制，我们通过 stderr 中的特征字符串来判断是否是内存超限，
     * 比如 Java 的 OutOfMemoryError、Python 的 MemoryError。
     * 没有超时但被 SIGKILL 杀死（docker 返回 137）的程序同样视为内存超限，
     * 因此选手程序自行 kill -9 也会得到该结果。
     * 如果用户程序自行捕获了该错误，则评测结果可能变成其他值。
     */
    MEMORY_LIMIT_EXCEEDED = 4,

    /**
     * @brief 用户程序非正常退出
     */
    RUNTIME_ERROR = 5,

    /**
     * @brief 用户程序编译错误
     * 仅对需要编译的语言有效
     */
    COMPILATION_ERROR = 6,

    /**
     * @brief 内部错误，评测系统出错
     * 比如无法创建工作目录、无法启动容器
     */
    SYSTEM_ERROR = 7,

    /**
     * @brief 评测请求没有指定测试数据的来源
     * 只作为整个提交的评测结果，不会执行任何测试
     */
    CONFIGURATION_ERROR = 8,

    /**
     * @brief 找不到测试数据，或者测试数据为空
     * 只作为整个提交的评测结果
     */
    NO_TEST_CASES = 9,

    /**
     * @brief 读取测试数据存储时出错
     * 只作为整个提交的评测结果
     */
    DATABASE_ERROR = 10
};

const char *get_display_message(status);

/**
 * @brief 该评测结果是否表示测试点通过
 * @return true 当且仅当为 ACCEPTED 或 EXECUTED
 */
bool is_correct(status);

}  // namespace codejudge
