#pragma once

#include <string>
#include <unordered_map>

namespace termbar {
namespace common {

template<typename EnumType>
struct ErrorInfo {
    EnumType code;
    const char* code_str;
    const char* default_message;
};

// Static code -> name/message table. Each error enum specializes getInfoMap().
template<typename EnumType>
class ErrorRegistry {
public:
    static const char* toString(EnumType code) {
        const auto* info = find(code);
        return info ? info->code_str : "UNKNOWN";
    }
    
    static const char* getMessage(EnumType code) {
        const auto* info = find(code);
        return info ? info->default_message : "Unknown error";
    }
    
    // "<subject>: <message> [<CODE>]"
    static std::string describe(EnumType code, const std::string& subject) {
        return subject + ": " + getMessage(code) + " [" + toString(code) + "]";
    }
    
protected:
    static const std::unordered_map<EnumType, ErrorInfo<EnumType>>& getInfoMap();

private:
    static const ErrorInfo<EnumType>* find(EnumType code) {
        const auto& map = getInfoMap();
        auto it = map.find(code);
        return it != map.end() ? &it->second : nullptr;
    }
};

}}
