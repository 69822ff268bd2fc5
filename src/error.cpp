#include "mcpconn/error.hpp"

namespace mcpconn {

std::string_view error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ConfigurationError: return "ConfigurationError";
        case ErrorKind::CapacityError:      return "CapacityError";
        case ErrorKind::LaunchError:        return "LaunchError";
        case ErrorKind::HandshakeError:     return "HandshakeError";
        case ErrorKind::ToolNotFound:       return "ToolNotFound";
        case ErrorKind::ToolExecutionError: return "ToolExecutionError";
        case ErrorKind::Timeout:            return "TimeoutError";
        case ErrorKind::NotFound:           return "NotFound";
        case ErrorKind::ProcessDead:        return "ProcessDead";
        case ErrorKind::ProtocolError:      return "ProtocolError";
    }
    return "ProtocolError";
}

Error error_from_current_exception() {
    // Most specific types first: catch order matters for the hierarchy.
    try {
        throw;
    } catch (const CapacityError& e) {
        return {ErrorKind::CapacityError, e.what(), std::nullopt};
    } catch (const ConfigurationError& e) {
        return {ErrorKind::ConfigurationError, e.what(), std::nullopt};
    } catch (const LaunchError& e) {
        return {ErrorKind::LaunchError, e.what(), std::nullopt};
    } catch (const HandshakeError& e) {
        return {ErrorKind::HandshakeError, e.what(), std::nullopt};
    } catch (const ToolNotFoundError& e) {
        return {ErrorKind::ToolNotFound, e.what(),
                e.error.is_null() ? std::nullopt : std::optional<nlohmann::json>(e.error)};
    } catch (const ToolExecutionError& e) {
        return {ErrorKind::ToolExecutionError, e.what(),
                e.error.is_null() ? std::nullopt : std::optional<nlohmann::json>(e.error)};
    } catch (const TimeoutError& e) {
        return {ErrorKind::Timeout, e.what(), std::nullopt};
    } catch (const NotFoundError& e) {
        return {ErrorKind::NotFound, e.what(), std::nullopt};
    } catch (const ProcessDeadError& e) {
        return {ErrorKind::ProcessDead, e.what(), std::nullopt};
    } catch (const std::exception& e) {
        return {ErrorKind::ProtocolError, e.what(), std::nullopt};
    } catch (...) {
        return {ErrorKind::ProtocolError, "Unknown error", std::nullopt};
    }
}

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json::object();
    j["status"] = "error";
    if (e.data) {
        j["error"] = *e.data;
        j["message"] = e.message;
    } else {
        j["error"] = e.message;
    }
    j["error_type"] = std::string(error_kind_to_string(e.kind));
}

} // namespace mcpconn
