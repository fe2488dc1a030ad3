#include "sluice/DispatchRegistry.hpp"

#include "spdlog/spdlog.h"

namespace sluice {

bool DispatchRegistry::registerImplementation(std::string_view interfaceName, std::string_view methodName,
                                              Implementation implementation) {
    if (m_sealed) {
        SPDLOG_ERROR("Registration of {}.{} refused, dispatch registry is sealed", interfaceName, methodName);
        return false;
    }
    if (!implementation) {
        SPDLOG_ERROR("Empty implementation registered for {}.{}", interfaceName, methodName);
        return false;
    }

    Hash key = dispatchKey(interfaceName, methodName);
    auto iter = m_entries.find(key);
    if (iter != m_entries.end()) {
        if (iter->second.interfaceName == interfaceName && iter->second.methodName == methodName) {
            SPDLOG_ERROR("Duplicate registration for {}.{}", interfaceName, methodName);
        } else {
            SPDLOG_ERROR("Dispatch key 0x{:08x} for {}.{} collides with {}.{}", key, interfaceName, methodName,
                         iter->second.interfaceName, iter->second.methodName);
        }
        return false;
    }

    m_entries.emplace(std::make_pair(
        key, Entry{std::string(interfaceName), std::string(methodName), std::move(implementation)}));
    SPDLOG_DEBUG("Registered {}.{} with dispatch key 0x{:08x}", interfaceName, methodName, key);
    return true;
}

Status DispatchRegistry::dispatch(Session* session, Hash key, RawHandle receiver, ArenaRegion args,
                                  ArenaRegion& result) {
    m_sealed = true;
    result = ArenaRegion{0, 0};

    auto iter = m_entries.find(key);
    if (iter == m_entries.end()) {
        SPDLOG_ERROR("No implementation registered for dispatch key 0x{:08x}", key);
        return kNotRegistered;
    }

    Status status = iter->second.implementation(session, receiver, args, result);
    if (status != kOk) {
        SPDLOG_WARN("{}.{} returned {}", iter->second.interfaceName, iter->second.methodName, statusName(status));
    }
    return status;
}

const Implementation* DispatchRegistry::lookup(std::string_view interfaceName, std::string_view methodName) const {
    auto iter = m_entries.find(dispatchKey(interfaceName, methodName));
    if (iter == m_entries.end() || iter->second.interfaceName != interfaceName ||
        iter->second.methodName != methodName) {
        return nullptr;
    }
    return &iter->second.implementation;
}

} // namespace sluice
