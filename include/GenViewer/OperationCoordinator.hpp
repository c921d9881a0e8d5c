#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <GenViewer/AssetFetcher.hpp>
#include <GenViewer/ViewerState.hpp>

namespace GenViewer {

enum class OperationKind { Loading, Generating };

/**
 * @brief Idle, Busy(kind) or Failed(message).
 */
struct OperationStatus {
    enum class State { Idle, Busy, Failed };
    State state = State::Idle;
    OperationKind kind = OperationKind::Loading; // meaningful while Busy
    std::string message;                        // meaningful while Failed

    static OperationStatus idle(){ return OperationStatus(); }
    static OperationStatus busy(OperationKind k){ OperationStatus s; s.state = State::Busy; s.kind = k; return s; }
    static OperationStatus failed(const std::string& msg){ OperationStatus s; s.state = State::Failed; s.message = msg; return s; }

    bool isIdle() const { return state == State::Idle; }
    bool isBusy() const { return state == State::Busy; }
    bool isFailed() const { return state == State::Failed; }

    bool operator==(const OperationStatus& o) const;
    bool operator!=(const OperationStatus& o) const { return !(*this == o); }

    // "Idle", "Busy(Loading)", "Failed(<message>)"
    std::string describe() const;
};

// Alert to show the user once (title "Success" or "Error")
struct Notice {
    std::string title;
    std::string text;
};

// Startup loads stay quiet on success; user reloads announce themselves
enum class LoadTrigger { Startup, Reload };

/**
 * @brief Serializes load/generate requests and owns OperationStatus.
 *
 * Main-thread only. requestLoad/requestGenerate start a worker through the
 * AssetFetcher and are accepted only while Idle; poll() harvests finished work
 * once per frame. Each request gets a new generation number; a completion whose
 * generation is no longer current (after cancel()) is dropped without touching
 * the scene or the status.
 */
class OperationCoordinator {
public:
    using StatusListener = std::function<void(const OperationStatus&)>;

    OperationCoordinator(ViewerState& state, AssetFetcher& fetcher, std::string modelUrl, std::string generateUrl);
    ~OperationCoordinator();

    OperationCoordinator(const OperationCoordinator&) = delete;
    OperationCoordinator& operator=(const OperationCoordinator&) = delete;

    bool requestLoad(LoadTrigger trigger = LoadTrigger::Reload);
    bool requestGenerate();

    // Harvest a finished request, if any. Call every frame.
    void poll();

    // Failed -> Idle once the error has been shown. No-op in other states.
    void acknowledge();

    // Abandon the in-flight request (Busy -> Idle). Its result is discarded.
    void cancel();

    const OperationStatus& status() const { return status_; }
    // True whenever the status is not Idle; drives the modal and disables buttons
    bool isBusy() const { return !status_.isIdle(); }
    bool hasPending() const { return pending_ != nullptr; }
    uint64_t generation() const { return generation_; }
    size_t abandonedCount() const { return abandoned_.size(); }
    // Requests whose workers have not been harvested yet, pending or abandoned
    size_t outstandingCount() const { return abandoned_.size() + (pending_ ? 1 : 0); }

    // Pops the oldest undisplayed notice
    std::optional<Notice> takeNotice();
    bool hasNotice() const { return !notices_.empty(); }

    void setStatusListener(StatusListener listener) { listener_ = std::move(listener); }

private:
    struct PendingRequest {
        OperationKind kind = OperationKind::Loading;
        LoadTrigger trigger = LoadTrigger::Reload;
        uint64_t generation = 0;
        std::future<ModelFetchResult> model;
        std::future<GenerateResult> generate;
        bool ready() const;
    };

    bool begin(OperationKind kind);
    void finish(PendingRequest& req);
    void finishLoad(PendingRequest& req);
    void finishGenerate(PendingRequest& req);
    void succeed(const std::string& message, bool announce);
    void fail(const std::string& message);
    void setStatus(const OperationStatus& s);

    ViewerState& state_;
    AssetFetcher& fetcher_;
    std::string modelUrl_;
    std::string generateUrl_;

    OperationStatus status_;
    uint64_t generation_ = 0;
    std::unique_ptr<PendingRequest> pending_;
    // cancelled requests whose workers have not returned yet
    std::vector<std::unique_ptr<PendingRequest>> abandoned_;
    std::vector<Notice> notices_;
    StatusListener listener_;
};

} // namespace GenViewer
