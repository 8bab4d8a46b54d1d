#include "coordguard/request.hpp"

#include <type_traits>

namespace coordguard {

const char* request_name(const Request& request) {
    return std::visit([](const auto& r) -> const char* {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, AgentJoin>)         return "AgentJoin";
        else if constexpr (std::is_same_v<T, AgentLeave>)   return "AgentLeave";
        else if constexpr (std::is_same_v<T, SetState>)     return "SetState";
        else if constexpr (std::is_same_v<T, AcquireLock>)  return "AcquireLock";
        else if constexpr (std::is_same_v<T, ReleaseLock>)  return "ReleaseLock";
        else if constexpr (std::is_same_v<T, DeclareScope>) return "DeclareScope";
        else if constexpr (std::is_same_v<T, RemoveScope>)  return "RemoveScope";
        else if constexpr (std::is_same_v<T, StartSync>)    return "StartSync";
        else if constexpr (std::is_same_v<T, CompleteSync>) return "CompleteSync";
        else                                                return "FailSync";
    }, request);
}

std::string to_string(const OperationError& error) {
    return std::visit([](auto e) { return std::string(to_string(e)); }, error);
}

} // namespace coordguard
