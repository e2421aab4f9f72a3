#include "backend_factory.hpp"
#include "local_backend.hpp"
#include "docker_backend.hpp"
#include "ssh_backend.hpp"
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

std::optional<BackendType> parse_backend_type(const std::string& name) {
    std::string n = to_lower(trimmed(name));
    if (n == "local") return BackendType::LOCAL;
    if (n == "docker") return BackendType::DOCKER;
    if (n == "ssh") return BackendType::SSH;
    return std::nullopt;
}

Result<std::shared_ptr<Backend>> create_backend(const Config& config) {
    using R = Result<std::shared_ptr<Backend>>;
    const auto& settings = config.backend();
    std::string requested = to_lower(trimmed(settings.type));

    if (requested.empty() || requested == "auto") {
        auto docker = std::make_shared<DockerBackend>(config.docker(), settings);
        if (docker->is_available()) {
            termkeep_log("backend: auto -> docker");
            return R::Ok(docker);
        }
        termkeep_log("backend: auto -> local");
        return R::Ok(std::make_shared<LocalBackend>(settings));
    }

    auto type = parse_backend_type(requested);
    if (!type) {
        return R::Err(ErrorCode::INVALID_PARAMETER,
                      fmt::format("Unknown backend type '{}' (expected local, docker, ssh or auto)",
                                  settings.type));
    }

    switch (*type) {
        case BackendType::LOCAL:
            return R::Ok(std::make_shared<LocalBackend>(settings));

        case BackendType::DOCKER: {
            auto docker = std::make_shared<DockerBackend>(config.docker(), settings);
            if (!docker->is_available()) {
                return R::Err(ErrorCode::DOCKER_NOT_AVAILABLE, "Docker is not available");
            }
            return R::Ok(docker);
        }

        case BackendType::SSH:
            if (config.ssh().host.empty()) {
                return R::Err(ErrorCode::INVALID_PARAMETER, "ssh.host is not configured");
            }
            return R::Ok(std::make_shared<SshBackend>(config.ssh(), settings));
    }
    return R::Err(ErrorCode::BACKEND_NOT_AVAILABLE, "No backend available");
}
