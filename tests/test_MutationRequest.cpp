#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>
#include "refactor/MutationRequest.h"

using namespace std::chrono_literals;

namespace {

struct Pipe {
    Pipe() { ok = ::pipe(fds) == 0; }
    ~Pipe() {
        if (!ok) return;
        ::close(fds[0]);
        if (fds[1] >= 0) ::close(fds[1]);
    }
    void send(const std::string& text) { ASSERT_EQ(::write(fds[1], text.data(), text.size()), static_cast<ssize_t>(text.size())); }
    void closeWriter() {
        ::close(fds[1]);
        fds[1] = -1;
    }
    int readFd() const { return fds[0]; }

    int fds[2] = {-1, -1};
    bool ok = false;
};

} // namespace

TEST(MutationRequestTest, StartsPending) {
    MutationRequest request("rename a -> b", {});
    EXPECT_EQ(request.decision(), MutationRequest::Decision::Pending);
    EXPECT_EQ(request.getDescription(), "rename a -> b");
    EXPECT_TRUE(request.getEdits().empty());
}

TEST(MutationRequestTest, ApproveUnblocksWaiter) {
    auto request = std::make_shared<MutationRequest>("apply", std::vector<Edit>{});
    std::thread responder([request] {
        std::this_thread::sleep_for(20ms);
        request->approve();
    });
    EXPECT_EQ(request->wait(5s), MutationRequest::Decision::Approved);
    responder.join();
}

TEST(MutationRequestTest, RejectCarriesReason) {
    MutationRequest request("apply", {});
    EXPECT_TRUE(request.reject("looks wrong"));
    EXPECT_EQ(request.wait(10ms), MutationRequest::Decision::Rejected);
    EXPECT_EQ(request.rejectReason(), "looks wrong");
}

TEST(MutationRequestTest, FirstResponseWins) {
    MutationRequest request("apply", {});
    EXPECT_TRUE(request.approve());
    EXPECT_FALSE(request.reject("too late"));
    EXPECT_FALSE(request.approve());
    EXPECT_EQ(request.decision(), MutationRequest::Decision::Approved);
    EXPECT_EQ(request.rejectReason(), "");
}

TEST(MutationRequestTest, WaitTimesOutWithoutResponse) {
    MutationRequest request("apply", {});
    EXPECT_EQ(request.wait(10ms), MutationRequest::Decision::TimedOut);
    // 超时后仍可作出决定
    EXPECT_TRUE(request.approve());
    EXPECT_EQ(request.decision(), MutationRequest::Decision::Approved);
}

TEST(MutationRequestTest, RequestsDoNotShareState) {
    MutationRequest first("one", {});
    MutationRequest second("two", {});
    first.reject("no");
    EXPECT_EQ(second.decision(), MutationRequest::Decision::Pending);
    EXPECT_EQ(second.wait(5ms), MutationRequest::Decision::TimedOut);
}

TEST(MutationRequestTest, DecisionNames) {
    EXPECT_EQ(decisionName(MutationRequest::Decision::Pending), "pending");
    EXPECT_EQ(decisionName(MutationRequest::Decision::Approved), "approved");
    EXPECT_EQ(decisionName(MutationRequest::Decision::Rejected), "rejected");
    EXPECT_EQ(decisionName(MutationRequest::Decision::TimedOut), "timed_out");
}

TEST(LineAnswerTest, YesApproves) {
    Pipe pipe;
    ASSERT_TRUE(pipe.ok);
    pipe.send("yes\n");
    MutationRequest request("apply", {});
    EXPECT_EQ(awaitLineAnswer(request, pipe.readFd(), 5s, 10ms), MutationRequest::Decision::Approved);
}

TEST(LineAnswerTest, AnythingElseRejects) {
    Pipe pipe;
    ASSERT_TRUE(pipe.ok);
    pipe.send(" n \n");
    MutationRequest request("apply", {});
    EXPECT_EQ(awaitLineAnswer(request, pipe.readFd(), 5s, 10ms), MutationRequest::Decision::Rejected);
    EXPECT_EQ(request.rejectReason(), "declined by user");
}

TEST(LineAnswerTest, ClosedInputRejects) {
    Pipe pipe;
    ASSERT_TRUE(pipe.ok);
    pipe.closeWriter();
    MutationRequest request("apply", {});
    EXPECT_EQ(awaitLineAnswer(request, pipe.readFd(), 5s, 10ms), MutationRequest::Decision::Rejected);
    EXPECT_EQ(request.rejectReason(), "no input");
}

TEST(LineAnswerTest, TimeoutLeavesNoReaderBehind) {
    Pipe pipe;
    ASSERT_TRUE(pipe.ok);
    MutationRequest request("apply", {});
    auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(awaitLineAnswer(request, pipe.readFd(), 30ms, 10ms), MutationRequest::Decision::TimedOut);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
    EXPECT_EQ(request.decision(), MutationRequest::Decision::Rejected);
    EXPECT_EQ(request.rejectReason(), "timed out");

    // 超时后写入的内容没有被读走
    pipe.send("y\n");
    std::this_thread::sleep_for(50ms);
    char buf[8] = {};
    ASSERT_EQ(::read(pipe.readFd(), buf, sizeof(buf)), 2);
    EXPECT_EQ(std::string(buf, 2), "y\n");
    EXPECT_EQ(request.decision(), MutationRequest::Decision::Rejected);
}
