/**
 * @file ShipwrightApp.cpp
 * @brief Implementation of the ShipwrightApp class.
 */
#include "app/ShipwrightApp.hpp"

#include <atomic>
#include <csignal>
#include <iostream>
#include <map>
#include <optional>
#include "application/export/FileTransferExportAdapter.hpp"
#include "application/export/GitExportAdapter.hpp"
#include "application/export/NetlifyExportAdapter.hpp"
#include "application/export/VercelExportAdapter.hpp"
#include "domain/CredentialTypes.hpp"
#include "infrastructure/FtpSession.hpp"
#include "infrastructure/JsonCodec.hpp"
#include "infrastructure/LibsecretStore.hpp"
#include "infrastructure/SftpSession.hpp"

namespace shipwright::app {

namespace {

std::atomic<bool> g_interrupted{false};

void OnInterrupt(int) {
    g_interrupted = true;
}

struct Options {
    std::vector<std::string> positional;
    std::map<std::string, std::string> flags;
};

/** @brief Splits args into positionals and `--name value` pairs; returns false on a dangling flag. */
bool ParseOptions(const std::vector<std::string>& args, Options& out, std::string& error) {
    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& token = args[i];
        if (token.rfind("--", 0) == 0) {
            if (i + 1 >= args.size()) {
                error = "missing value for " + token;
                return false;
            }
            out.flags[token.substr(2)] = args[++i];
        } else {
            out.positional.push_back(token);
        }
    }
    return true;
}

std::optional<std::string> Flag(const Options& options, const std::string& name) {
    auto it = options.flags.find(name);
    if (it == options.flags.end()) return std::nullopt;
    return it->second;
}

bool OnlyFlags(const Options& options, std::initializer_list<const char*> allowed, std::string& error) {
    for (const auto& [name, value] : options.flags) {
        bool known = false;
        for (const char* candidate : allowed) {
            if (name == candidate) known = true;
        }
        if (!known) {
            error = "unknown option --" + name;
            return false;
        }
    }
    return true;
}

std::unique_ptr<domain::TransferSession> OpenTransferSession(domain::FtpProtocol protocol) {
    if (protocol == domain::FtpProtocol::Sftp) {
        return std::make_unique<infrastructure::SftpSession>();
    }
    return std::make_unique<infrastructure::FtpSession>();
}

} // namespace

ShipwrightApp::ShipwrightApp() = default;
ShipwrightApp::~ShipwrightApp() = default;

void ShipwrightApp::Init() {
    m_sink = std::make_unique<ConsoleEventSink>(std::cout);

    m_services.secretStore = std::make_shared<infrastructure::LibsecretStore>();
    m_services.credentialService = std::make_unique<application::CredentialService>(m_services.secretStore);
    m_services.jobRegistry = std::make_unique<application::ExportJobRegistry>();

    std::vector<std::unique_ptr<application::ExportAdapter>> adapters;
    adapters.push_back(std::make_unique<application::GitExportAdapter>());
    adapters.push_back(std::make_unique<application::FileTransferExportAdapter>(
        *m_services.credentialService, &OpenTransferSession));
    adapters.push_back(std::make_unique<application::NetlifyExportAdapter>(*m_services.credentialService));
    adapters.push_back(std::make_unique<application::VercelExportAdapter>());
    m_services.exportPipeline = std::make_unique<application::ExportPipeline>(std::move(adapters));

    m_services.jobManager = std::make_unique<application::ExportJobManager>(
        *m_services.jobRegistry, *m_services.exportPipeline, *m_sink);
    m_services.publishService = std::make_unique<application::PublishService>();
}

void ShipwrightApp::PrintUsage(std::ostream& out) {
    out << "usage:\n"
        << "  shipwright export <file> <git|ftp|netlify|vercel> [--profile <name>]\n"
        << "  shipwright credential get|set|delete <file> <ftp|netlify|vercel|git> <password|token>"
           " [--profile <name>] [--value <secret>]\n"
        << "  shipwright publish <project-root> <file>... [--out <dir>]\n"
        << "  shipwright deploy <project-root> <remote> [--out <dir>] [--branch <name>]\n";
}

int ShipwrightApp::Run(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    if (args.empty() || args[0] == "--help" || args[0] == "help") {
        PrintUsage(args.empty() ? std::cerr : std::cout);
        return args.empty() ? kExitUsage : kExitSuccess;
    }

    const std::string command = args[0];
    args.erase(args.begin());

    Init();

    if (command == "export") return RunExport(args);
    if (command == "credential") return RunCredential(args);
    if (command == "publish") return RunPublish(args);
    if (command == "deploy") return RunDeploy(args);

    std::cerr << "unknown command: " << command << "\n";
    PrintUsage(std::cerr);
    return kExitUsage;
}

int ShipwrightApp::RunExport(const std::vector<std::string>& args) {
    Options options;
    std::string error;
    if (!ParseOptions(args, options, error) || !OnlyFlags(options, {"profile"}, error)) {
        std::cerr << error << "\n";
        return kExitUsage;
    }
    if (options.positional.size() != 2) {
        PrintUsage(std::cerr);
        return kExitUsage;
    }
    auto target = domain::TargetFromString(options.positional[1]);
    if (!target) {
        std::cerr << "unknown export target: " << options.positional[1] << "\n";
        return kExitUsage;
    }

    domain::ExportRequest request;
    request.filePath = options.positional[0];
    request.target = *target;
    request.profile = Flag(options, "profile");

    g_interrupted = false;
    std::signal(SIGINT, OnInterrupt);

    std::string jobId = m_services.jobManager->submit(request);
    bool cancelRequested = false;
    std::optional<domain::ExportFinished> finished;
    while (!finished) {
        finished = m_sink->waitFor(jobId, std::chrono::milliseconds(100));
        if (!finished && g_interrupted && !cancelRequested) {
            m_services.jobManager->cancel(jobId);
            cancelRequested = true;
        }
    }
    m_services.jobManager->cleanup(jobId);
    std::signal(SIGINT, SIG_DFL);

    return finished->response.ok ? kExitSuccess : kExitFailure;
}

int ShipwrightApp::RunCredential(const std::vector<std::string>& args) {
    Options options;
    std::string error;
    if (!ParseOptions(args, options, error) || !OnlyFlags(options, {"profile", "value"}, error)) {
        std::cerr << error << "\n";
        return kExitUsage;
    }
    if (options.positional.size() != 4) {
        PrintUsage(std::cerr);
        return kExitUsage;
    }
    const std::string& action = options.positional[0];
    const std::string& file = options.positional[1];
    auto target = domain::CredentialTargetFromString(options.positional[2]);
    auto kind = domain::CredentialKindFromString(options.positional[3]);
    if (!target || !kind) {
        std::cerr << "unknown credential target or kind\n";
        return kExitUsage;
    }
    auto profile = Flag(options, "profile");

    try {
        if (action == "get") {
            auto value = m_services.credentialService->get(file, *target, profile, *kind);
            if (!value) {
                std::cerr << "[Shipwright] No credential stored" << std::endl;
                return kExitFailure;
            }
            std::cout << *value << std::endl;
            return kExitSuccess;
        }
        if (action == "set") {
            auto value = Flag(options, "value");
            if (!value) {
                std::cerr << "missing value for --value\n";
                return kExitUsage;
            }
            m_services.credentialService->set(file, *target, profile, *kind, *value);
            return kExitSuccess;
        }
        if (action == "delete") {
            m_services.credentialService->remove(file, *target, profile, *kind);
            return kExitSuccess;
        }
    } catch (const domain::CredentialError& e) {
        std::cerr << "[Shipwright] Credential error: " << e.what() << std::endl;
        return kExitFailure;
    }

    std::cerr << "unknown credential action: " << action << "\n";
    return kExitUsage;
}

int ShipwrightApp::RunPublish(const std::vector<std::string>& args) {
    Options options;
    std::string error;
    if (!ParseOptions(args, options, error) || !OnlyFlags(options, {"out"}, error)) {
        std::cerr << error << "\n";
        return kExitUsage;
    }
    if (options.positional.size() < 2) {
        PrintUsage(std::cerr);
        return kExitUsage;
    }

    domain::PublishRequest request;
    request.projectRoot = options.positional[0];
    request.files.assign(options.positional.begin() + 1, options.positional.end());
    request.outputDir = Flag(options, "out");

    try {
        auto response = m_services.publishService->Publish(request);
        std::cout << infrastructure::JsonCodec::ToJson(response).dump() << std::endl;
        return kExitSuccess;
    } catch (const domain::PublishError& e) {
        std::cerr << "[Shipwright] Publish failed: " << e.what() << std::endl;
        return kExitFailure;
    }
}

int ShipwrightApp::RunDeploy(const std::vector<std::string>& args) {
    Options options;
    std::string error;
    if (!ParseOptions(args, options, error) || !OnlyFlags(options, {"out", "branch"}, error)) {
        std::cerr << error << "\n";
        return kExitUsage;
    }
    if (options.positional.size() != 2) {
        PrintUsage(std::cerr);
        return kExitUsage;
    }

    domain::DeployRequest request;
    request.projectRoot = options.positional[0];
    request.remote = options.positional[1];
    request.outputDir = Flag(options, "out");
    request.branch = Flag(options, "branch");

    try {
        auto response = m_services.publishService->Deploy(request);
        std::cout << infrastructure::JsonCodec::ToJson(response).dump() << std::endl;
        return kExitSuccess;
    } catch (const domain::PublishError& e) {
        std::cerr << "[Shipwright] Deploy failed: " << e.what() << std::endl;
        return kExitFailure;
    }
}

} // namespace shipwright::app
