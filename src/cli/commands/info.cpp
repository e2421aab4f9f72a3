#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>

static std::string format_bytes(uint64_t bytes) {
    if (bytes == 0) return "-";
    double gib = static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0);
    return fmt::format("{:.1f} GiB", gib);
}

static void do_info(BaseCLI& cli, const std::string& arg) {
    if (!cli.require_runtime()) return;

    auto result = cli.backend->system_info();
    if (result.is_err()) {
        std::cout << theme::fail(error_code_name(result.code), result.error);
        return;
    }
    const auto& info = result.value;

    std::cout << theme::section("System");
    std::cout << theme::kv("Backend", backend_type_name(info.backend));
    std::cout << theme::kv("OS", info.os + (info.os_version.empty() ? "" : " " + info.os_version));
    std::cout << theme::kv("Kernel", info.kernel);
    std::cout << theme::kv("Host", info.hostname);
    std::cout << theme::kv("Arch", info.arch);
    std::cout << theme::kv("User", info.user);
    std::cout << theme::kv("Home", info.home_dir);
    std::cout << theme::kv("Shell", info.shell);
    if (info.total_memory > 0) {
        std::cout << theme::kv("Memory", fmt::format("{} free of {}",
                                                     format_bytes(info.free_memory),
                                                     format_bytes(info.total_memory)));
    }
    if (info.backend == BackendType::DOCKER) {
        std::cout << theme::kv("Docker", info.docker_version);
        std::cout << theme::kv("Container", info.container_id);
        std::cout << theme::kv("Image", info.image);
    }
    if (info.backend == BackendType::SSH) {
        std::cout << theme::kv("Remote", fmt::format("{}:{}", info.remote_host, info.remote_port));
    }
    std::cout << "\n";
}

void register_info_commands(BaseCLI& cli) {
    cli.add_command("info", do_info, "Show backend system information");
}
