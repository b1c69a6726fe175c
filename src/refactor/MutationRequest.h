#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>
#include "refactor/Edit.h"

/**
 * @brief 一次待确认的写操作及其专属应答通道
 *
 * 每个请求自带 mutex / condition_variable，互不共享状态。
 * 第一个应答（approve 或 reject）生效，之后的应答被忽略。
 */
class MutationRequest {
public:
    enum class Decision { Pending, Approved, Rejected, TimedOut };

    MutationRequest(std::string description, std::vector<Edit> edits)
        : description(std::move(description)), edits(std::move(edits)) {}

    MutationRequest(const MutationRequest&) = delete;
    MutationRequest& operator=(const MutationRequest&) = delete;

    const std::string& getDescription() const { return description; }
    const std::vector<Edit>& getEdits() const { return edits; }

    /** @return 是否由本次调用作出决定 */
    bool approve();
    bool reject(const std::string& reason);

    /** 阻塞直到有应答或超时；超时返回 TimedOut，请求仍可被之后的应答决定 */
    Decision wait(std::chrono::milliseconds timeout);

    Decision decision() const;
    std::string rejectReason() const;

private:
    bool respond(Decision d, const std::string& reason);

    std::string description;
    std::vector<Edit> edits;

    mutable std::mutex mtx;
    std::condition_variable cv;
    Decision state = Decision::Pending;
    std::string reason;
};

std::string decisionName(MutationRequest::Decision d);

/**
 * @brief 在 fd 上读取一行 y/N 作为 request 的应答
 *
 * "y" / "Y" / "yes" 批准，其余拒绝；timeout 内没有应答则 reject("timed out") 并返回 TimedOut。
 * 读取线程每 pollInterval 检查一次请求是否已有结论，函数返回前一定 join，
 * 超时之后不会再有线程读取 fd。
 */
MutationRequest::Decision awaitLineAnswer(MutationRequest& request, int fd, std::chrono::milliseconds timeout,
                                          std::chrono::milliseconds pollInterval = std::chrono::milliseconds(200));
