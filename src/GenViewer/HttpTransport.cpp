#include <GenViewer/HttpTransport.hpp>

namespace GenViewer {

bool HttpResponse::bodyJson(nlohmann::json& out, std::string* outError) const {
    try{
        out = nlohmann::json::parse(body);
    } catch(const nlohmann::json::parse_error& ex){
        if(outError) *outError = ex.what();
        return false;
    }
    return true;
}

} // namespace GenViewer
