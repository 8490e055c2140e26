#pragma once

#include <filesystem>

namespace grader {

/**
 * @brief 评测器脚本的退出码约定
 * 这些值会以 E_SUCCESS=0 这样的环境变量传给沙箱内的评测器
 */
enum error_codes {
    /**
     * @brief 评测器正常执行完所有检查（不论检查是否通过）
     */
    E_SUCCESS = 0,

    /**
     * @brief 评测器自身的运行环境出错，与提交内容无关，可以重试
     */
    E_INTERNAL_ERROR = 2,

    /**
     * @brief 选手代码崩溃，评测器无法继续执行后续检查
     * 其他未约定的退出码也按照该情况处理
     */
    E_SUBMISSION_ERROR = 48
};

/**
 * @brief 单个提交评测的默认时钟时间限制
 * 单位为秒，小于等于 0 表示不限制
 */
extern double DEFAULT_TIMEOUT;

/**
 * @brief 沙箱内进程的默认内存（地址空间）限制
 * 单位为 KB，小于 0 表示不限制
 */
extern long DEFAULT_MEM_LIMIT;

/**
 * @brief 沙箱内进程写入单个文件的默认大小限制
 * 单位为 KB，小于 0 表示不限制
 */
extern long DEFAULT_FILE_LIMIT;

/**
 * @brief 运行目录剩余空间低于该值时拒绝创建新的沙箱
 * 单位为 KB
 */
extern long MIN_FREE_SPACE;

/**
 * @brief 存放评测器镜像的路径，为项目根目录下的 exec 文件夹
 * 每个沙箱创建时都会把这个目录以只读的方式复制为沙箱内的 image 文件夹
 *
 * EXEC_DIR
 * └── evaluate // 默认的评测器入口
 */
extern std::filesystem::path EXEC_DIR;

/**
 * @brief 沙箱的根目录
 * 每个沙箱都是 RUN_DIR 下的一个私有文件夹，沙箱之间不共享任何文件
 *
 * RUN_DIR
 * ├── 1b4e28ba-2fa1-11d2-883f-0016d3cca427 // 随机生成的 uuid，一个沙箱
 * │   ├── image // 评测器镜像，只读
 * │   ├── checks // 检查集，只读
 * │   ├── submission // 选手提交
 * │   │   └── hw01.py
 * │   ├── results.jsonl // 评测器逐行写入的检查结果
 * │   ├── program.out // 评测器的 stdout 输出
 * │   └── program.err // 评测器的 stderr 输出
 * └── ...
 */
extern std::filesystem::path RUN_DIR;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，评测器的 stdout 和 stderr 会被写入日志，
 * 以便手动检查评测器的行为是否符合预期。
 */
extern bool DEBUG;

}  // namespace grader
