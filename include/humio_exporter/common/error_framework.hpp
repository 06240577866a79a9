#pragma once

#include <string>
#include <unordered_map>

namespace humio_exporter {
namespace common {

template<typename EnumType>
struct ErrorInfo {
    const char* name;
    const char* message;
};

// Name and default message per error code. Each error enum supplies its
// entries by specializing table().
template<typename EnumType>
class ErrorRegistry {
public:
    using Table = std::unordered_map<EnumType, ErrorInfo<EnumType>>;
    
    static const char* toString(EnumType code) {
        return lookup(code).name;
    }
    
    static const char* getMessage(EnumType code) {
        return lookup(code).message;
    }
    
    static std::string describe(EnumType code, const std::string& detail) {
        std::string text = getMessage(code);
        if (!detail.empty()) {
            text += ": " + detail;
        }
        return text;
    }
    
protected:
    static const Table& table();

private:
    static ErrorInfo<EnumType> lookup(EnumType code) {
        const auto& entries = table();
        auto it = entries.find(code);
        if (it == entries.end()) {
            return {"UNKNOWN", "unknown error"};
        }
        return it->second;
    }
};

}}
