#include <flowgraph/flowgraph.h>
#include <flowgraph/common/Logger.h>

#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace flowgraph;

namespace {

void printUsage() {
    std::cerr << "flowgraph " << versionString() << "\n"
              << "Usage: flowgraph_cli <command> <workflow.json> [--options file] [--out file]\n"
              << "Commands:\n"
              << "  layout                 apply the DAG layout and write the workflow\n"
              << "  validate               print validation issues (exit 1 on errors)\n"
              << "  fit <w> <h> <padding>  fit the viewport to all nodes and write the workflow\n";
}

std::optional<LayoutOptions> readLayoutOptions(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        std::cerr << "Cannot open options file: " << path << "\n";
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    try {
        return WorkflowSerializer::layoutOptionsFromJson(nlohmann::json::parse(buffer.str()));
    } catch (const std::exception& e) {
        std::cerr << "Invalid options file " << path << ": " << e.what() << "\n";
        return std::nullopt;
    }
}

int writeWorkflow(const Workflow& workflow, const std::string& outPath) {
    if (outPath.empty()) {
        std::cout << WorkflowSerializer::toString(workflow) << "\n";
        return 0;
    }
    if (!WorkflowSerializer::saveToFile(workflow, outPath)) {
        std::cerr << "Failed to write " << outPath << "\n";
        return 1;
    }
    std::cerr << "Wrote " << outPath << "\n";
    return 0;
}

int runLayout(Workflow& workflow, const LayoutOptions& options, const std::string& outPath) {
    DagLayout layout(options);
    LayoutStatus status = layout.apply(workflow);
    if (status == LayoutStatus::CyclicGraph) {
        std::cerr << "Layout skipped: " << layoutStatusToString(status) << "\n";
        return 1;
    }

    const auto& stats = layout.lastStats();
    std::cerr << "Layout " << layoutStatusToString(status) << ": "
              << stats.layerCount << " layers, widest " << stats.maxLayerWidth
              << ", " << stats.edgeCrossings << " crossings\n";
    return writeWorkflow(workflow, outPath);
}

int runValidate(const Workflow& workflow) {
    WorkflowValidator validator;
    ValidationResult result = validator.validate(workflow);

    for (const auto& issue : result.issues) {
        std::cout << validationSeverityToString(issue.severity) << ": " << issue.message;
        if (issue.nodeId) {
            std::cout << " (node " << *issue.nodeId << ")";
        }
        std::cout << "\n";
    }
    std::cout << result.errorCount() << " errors, " << result.warningCount() << " warnings\n";
    return result.isValid() ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
    Logger::initialize();

    std::vector<std::string> positional;
    std::string optionsPath;
    std::string outPath;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--options" && i + 1 < argc) {
            optionsPath = argv[++i];
        } else if (arg.find("--options=") == 0) {
            optionsPath = arg.substr(10);
        } else if (arg == "--out" && i + 1 < argc) {
            outPath = argv[++i];
        } else if (arg.find("--out=") == 0) {
            outPath = arg.substr(6);
        } else if (arg == "-h" || arg == "--help") {
            printUsage();
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2) {
        printUsage();
        return 2;
    }

    const std::string& command = positional[0];
    const std::string& inputPath = positional[1];

    auto workflow = WorkflowSerializer::loadFromFile(inputPath);
    if (!workflow) {
        std::cerr << "Cannot load workflow: " << inputPath << "\n";
        return 1;
    }

    LayoutOptions options;
    if (!optionsPath.empty()) {
        auto loaded = readLayoutOptions(optionsPath);
        if (!loaded) {
            return 2;
        }
        options = *loaded;
    }

    if (command == "layout") {
        return runLayout(*workflow, options, outPath);
    }
    if (command == "validate") {
        return runValidate(*workflow);
    }
    if (command == "fit") {
        if (positional.size() < 5) {
            printUsage();
            return 2;
        }
        try {
            float width = std::stof(positional[2]);
            float height = std::stof(positional[3]);
            float padding = std::stof(positional[4]);
            workflow->fitView(width, height, padding);
        } catch (const std::exception&) {
            std::cerr << "fit expects numeric <w> <h> <padding>\n";
            return 2;
        }
        return writeWorkflow(*workflow, outPath);
    }

    std::cerr << "Unknown command: " << command << "\n";
    printUsage();
    return 2;
}
