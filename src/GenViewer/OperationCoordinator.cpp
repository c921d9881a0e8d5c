#include <GenViewer/OperationCoordinator.hpp>
#include <GenViewer/ModelNormalizer.hpp>
#include <plog/Log.h>
#include <chrono>

namespace GenViewer {

namespace {

const char* kindName(OperationKind k){
    return k == OperationKind::Loading ? "Loading" : "Generating";
}

template<typename T>
bool isReady(const std::future<T>& f){
    return f.valid() && f.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
}

} // namespace

bool OperationStatus::operator==(const OperationStatus& o) const {
    if(state != o.state) return false;
    if(state == State::Busy) return kind == o.kind;
    if(state == State::Failed) return message == o.message;
    return true;
}

std::string OperationStatus::describe() const {
    switch(state){
        case State::Idle: return "Idle";
        case State::Busy: return std::string("Busy(") + kindName(kind) + ")";
        case State::Failed: return "Failed(" + message + ")";
    }
    return "Unknown";
}

bool OperationCoordinator::PendingRequest::ready() const {
    return kind == OperationKind::Loading ? isReady(model) : isReady(generate);
}

OperationCoordinator::OperationCoordinator(ViewerState& state, AssetFetcher& fetcher, std::string modelUrl, std::string generateUrl)
    : state_(state), fetcher_(fetcher), modelUrl_(std::move(modelUrl)), generateUrl_(std::move(generateUrl)) {}

OperationCoordinator::~OperationCoordinator(){
    // std::async futures join their worker on destruction; bounded by the transport timeout
    if(outstandingCount() > 0) PLOGW << "op:shutdown blocked on " << outstandingCount() << " outstanding request(s) until they return or time out";
}

bool OperationCoordinator::begin(OperationKind kind){
    if(!status_.isIdle()){
        PLOGW << "op:rejecting " << kindName(kind) << " request while " << status_.describe();
        return false;
    }
    auto req = std::make_unique<PendingRequest>();
    req->kind = kind;
    req->generation = ++generation_;
    pending_ = std::move(req);
    setStatus(OperationStatus::busy(kind));
    return true;
}

bool OperationCoordinator::requestLoad(LoadTrigger trigger){
    if(!begin(OperationKind::Loading)) return false;
    pending_->trigger = trigger;
    PLOGI << "op:load #" << pending_->generation << " " << modelUrl_;
    try{
        pending_->model = fetcher_.fetchModel(modelUrl_);
    } catch(const std::exception& ex){
        PLOGE << "op:could not start load: " << ex.what();
        pending_.reset();
        fail(std::string("Failed to load model: ") + ex.what());
        return false;
    }
    return true;
}

bool OperationCoordinator::requestGenerate(){
    if(!begin(OperationKind::Generating)) return false;
    PLOGI << "op:generate #" << pending_->generation << " " << generateUrl_;
    try{
        pending_->generate = fetcher_.triggerGenerate(generateUrl_);
    } catch(const std::exception& ex){
        PLOGE << "op:could not start generate: " << ex.what();
        pending_.reset();
        fail(std::string("Failed to generate model: ") + ex.what());
        return false;
    }
    return true;
}

void OperationCoordinator::poll(){
    // drop abandoned requests whose workers have returned; their results are stale
    for(auto it = abandoned_.begin(); it != abandoned_.end();){
        PendingRequest& req = **it;
        if(!req.ready()){ ++it; continue; }
        try{
            if(req.kind == OperationKind::Loading) req.model.get(); else req.generate.get();
        } catch(const std::exception& ex){
            PLOGD << "op:abandoned #" << req.generation << " ended with exception: " << ex.what();
        }
        PLOGI << "op:discarded stale " << kindName(req.kind) << " #" << req.generation << " (current #" << generation_ << ")";
        it = abandoned_.erase(it);
    }

    if(!pending_ || !pending_->ready()) return;
    std::unique_ptr<PendingRequest> req = std::move(pending_);
    finish(*req);
}

void OperationCoordinator::finish(PendingRequest& req){
    if(req.generation != generation_){
        PLOGI << "op:ignoring stale completion #" << req.generation;
        return;
    }
    try{
        if(req.kind == OperationKind::Loading) finishLoad(req);
        else finishGenerate(req);
    } catch(const std::exception& ex){
        PLOGE << "op:" << kindName(req.kind) << " #" << req.generation << " threw: " << ex.what();
        fail(ex.what());
    }
}

void OperationCoordinator::finishLoad(PendingRequest& req){
    ModelFetchResult result = req.model.get();
    if(!result.ok()){
        PLOGW << "op:load #" << req.generation << " failed (" << toString(result.error) << "): " << result.message;
        fail(result.message.empty() ? std::string("Failed to load model") : result.message);
        return;
    }
    std::unique_ptr<Pivot> pivot = ModelNormalizer::normalize(result.mesh);
    if(!pivot){
        fail("Failed to load model");
        return;
    }
    std::unique_ptr<Pivot> previous = state_.scene.replaceModel(std::move(pivot));
    if(previous) PLOGD << "op:released previous pivot id=" << previous->id();
    succeed("Model reloaded successfully", req.trigger == LoadTrigger::Reload);
}

void OperationCoordinator::finishGenerate(PendingRequest& req){
    GenerateResult result = req.generate.get();
    if(!result.ok()){
        PLOGW << "op:generate #" << req.generation << " failed (" << toString(result.error) << "): " << result.message;
        fail(result.message.empty() ? std::string("Failed to generate model") : result.message);
        return;
    }
    succeed(result.message, true);
}

void OperationCoordinator::succeed(const std::string& message, bool announce){
    setStatus(OperationStatus::idle());
    if(announce) notices_.push_back(Notice{"Success", message});
}

void OperationCoordinator::fail(const std::string& message){
    setStatus(OperationStatus::failed(message));
}

void OperationCoordinator::acknowledge(){
    if(!status_.isFailed()) return;
    PLOGD << "op:error acknowledged: " << status_.message;
    setStatus(OperationStatus::idle());
}

void OperationCoordinator::cancel(){
    if(!pending_) return;
    PLOGI << "op:cancel " << kindName(pending_->kind) << " #" << pending_->generation;
    abandoned_.push_back(std::move(pending_));
    ++generation_;
    if(status_.isBusy()) setStatus(OperationStatus::idle());
}

std::optional<Notice> OperationCoordinator::takeNotice(){
    if(notices_.empty()) return std::nullopt;
    Notice n = notices_.front();
    notices_.erase(notices_.begin());
    return n;
}

void OperationCoordinator::setStatus(const OperationStatus& s){
    if(s == status_) return;
    PLOGD << "op:status " << status_.describe() << " -> " << s.describe();
    status_ = s;
    if(listener_) listener_(status_);
}

} // namespace GenViewer
