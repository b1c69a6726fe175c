#include "refactor/MutationRequest.h"
#include "utils/FileIO.h"
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <thread>
#include <unistd.h>

bool MutationRequest::respond(Decision d, const std::string& why) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (state != Decision::Pending) return false;
        state = d;
        reason = why;
    }
    cv.notify_all();
    return true;
}

bool MutationRequest::approve() {
    return respond(Decision::Approved, "");
}

bool MutationRequest::reject(const std::string& why) {
    return respond(Decision::Rejected, why);
}

MutationRequest::Decision MutationRequest::wait(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mtx);
    bool answered = cv.wait_for(lock, timeout, [&] { return state != Decision::Pending; });
    return answered ? state : Decision::TimedOut;
}

MutationRequest::Decision MutationRequest::decision() const {
    std::lock_guard<std::mutex> lock(mtx);
    return state;
}

std::string MutationRequest::rejectReason() const {
    std::lock_guard<std::mutex> lock(mtx);
    return reason;
}

std::string decisionName(MutationRequest::Decision d) {
    switch (d) {
        case MutationRequest::Decision::Pending: return "pending";
        case MutationRequest::Decision::Approved: return "approved";
        case MutationRequest::Decision::Rejected: return "rejected";
        case MutationRequest::Decision::TimedOut: return "timed_out";
    }
    return "pending";
}

MutationRequest::Decision awaitLineAnswer(MutationRequest& request, int fd, std::chrono::milliseconds timeout,
                                          std::chrono::milliseconds pollInterval) {
    std::thread reader([&request, fd, pollInterval]() {
        std::string line;
        while (request.decision() == MutationRequest::Decision::Pending) {
            pollfd pfd{fd, POLLIN, 0};
            int ready = ::poll(&pfd, 1, static_cast<int>(pollInterval.count()));
            if (ready < 0) {
                if (errno == EINTR) continue;
                request.reject(std::string("cannot read input: ") + std::strerror(errno));
                return;
            }
            if (ready == 0) continue;

            char buf[256];
            ssize_t n = ::read(fd, buf, sizeof(buf));
            if (n < 0) {
                if (errno == EINTR || errno == EAGAIN) continue;
                request.reject(std::string("cannot read input: ") + std::strerror(errno));
                return;
            }
            if (n > 0) {
                line.append(buf, static_cast<size_t>(n));
                size_t nl = line.find('\n');
                if (nl == std::string::npos) continue;
                line.resize(nl);
            } else if (line.empty()) {
                request.reject("no input");
                return;
            }

            std::string answer = FileIO::trim(line);
            if (answer == "y" || answer == "Y" || answer == "yes") {
                request.approve();
            } else {
                request.reject("declined by user");
            }
        }
    });

    MutationRequest::Decision decision = request.wait(timeout);
    if (decision == MutationRequest::Decision::TimedOut) request.reject("timed out");
    reader.join();
    return decision;
}
