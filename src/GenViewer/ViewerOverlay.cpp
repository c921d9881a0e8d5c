#include <GenViewer/ViewerOverlay.hpp>
#include <imgui.h>
#include <plog/Log.h>
#include <string>

namespace GenViewer {

namespace {

// Center the next popup on the main viewport
void CenterNextPopupOnMainViewport(){
    ImGuiViewport* main_viewport = ImGui::GetMainViewport();
    if(main_viewport){
        ImVec2 center(main_viewport->WorkPos.x + main_viewport->WorkSize.x * 0.5f,
                      main_viewport->WorkPos.y + main_viewport->WorkSize.y * 0.5f);
        ImGui::SetNextWindowPos(center, ImGuiCond_Always, ImVec2(0.5f, 0.5f));
    }
}

const char* kBusyPopup = "Working";
const char* kAlertPopup = "Alert";

} // namespace

ViewerOverlay::ViewerOverlay(OperationCoordinator& coordinator, RotationController& rotation)
    : coordinator_(coordinator), rotation_(rotation) {}

void ViewerOverlay::handleInput(){
    ImGuiIO& io = ImGui::GetIO();
    if(io.WantCaptureMouse) return;
    // no drag threshold: every unit moved with the button down counts
    rotation_.onPointerMove(ImGui::IsMouseDown(ImGuiMouseButton_Left), io.MouseDelta.x, io.MouseDelta.y);
}

void ViewerOverlay::draw(){
    drawButtons();
    drawBusyModal();
    drawAlertModal();
}

void ViewerOverlay::drawButtons(){
    ImGuiViewport* vp = ImGui::GetMainViewport();
    const float pad = 12.0f;
    ImGui::SetNextWindowPos(ImVec2(vp->WorkPos.x + vp->WorkSize.x * 0.5f, vp->WorkPos.y + vp->WorkSize.y - pad), ImGuiCond_Always, ImVec2(0.5f, 1.0f));
    ImGui::SetNextWindowBgAlpha(0.35f);
    ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoSavedSettings | ImGuiWindowFlags_NoMove | ImGuiWindowFlags_NoFocusOnAppearing;
    ImGui::Begin("##viewer_actions", nullptr, flags);
    bool busy = coordinator_.isBusy();
    if(busy) ImGui::BeginDisabled();
    if(ImGui::Button("Generate")){
        if(!coordinator_.requestGenerate()) PLOGD << "ui:generate ignored";
    }
    ImGui::SameLine();
    if(ImGui::Button("Reload Model")){
        if(!coordinator_.requestLoad(LoadTrigger::Reload)) PLOGD << "ui:reload ignored";
    }
    if(busy) ImGui::EndDisabled();
    ImGui::End();
}

void ViewerOverlay::drawBusyModal(){
    const OperationStatus& st = coordinator_.status();
    if(st.isBusy() && !ImGui::IsPopupOpen(kBusyPopup)) ImGui::OpenPopup(kBusyPopup);
    CenterNextPopupOnMainViewport();
    if(ImGui::BeginPopupModal(kBusyPopup, nullptr, ImGuiWindowFlags_AlwaysAutoResize | ImGuiWindowFlags_NoTitleBar)){
        if(!st.isBusy()){
            ImGui::CloseCurrentPopup();
        } else {
            spinnerPhase_ = (spinnerPhase_ + 1) % 40;
            std::string dots(spinnerPhase_ / 10, '.');
            ImGui::Text("%s%s", st.kind == OperationKind::Loading ? "Loading model" : "Generating model", dots.c_str());
        }
        ImGui::EndPopup();
    }
}

void ViewerOverlay::drawAlertModal(){
    const OperationStatus& st = coordinator_.status();
    if(!shownNotice_){
        if(st.isFailed()) shownNotice_ = Notice{"Error", st.message};
        else shownNotice_ = coordinator_.takeNotice();
        if(shownNotice_) ImGui::OpenPopup(kAlertPopup);
    }
    CenterNextPopupOnMainViewport();
    if(ImGui::BeginPopupModal(kAlertPopup, nullptr, ImGuiWindowFlags_AlwaysAutoResize)){
        if(shownNotice_){
            ImGui::TextUnformatted(shownNotice_->title.c_str());
            ImGui::Separator();
            ImGui::TextWrapped("%s", shownNotice_->text.c_str());
        }
        if(ImGui::Button("OK")){
            if(coordinator_.status().isFailed()) coordinator_.acknowledge();
            shownNotice_.reset();
            ImGui::CloseCurrentPopup();
        }
        ImGui::EndPopup();
    }
}

} // namespace GenViewer
