/**
 * @file notebook.cpp
 * @brief nbformat 4 execution log: parsing, atomic saves and output collection
 *
 * Saves go through `<path>.tmp` followed by a rename, so a crash never
 * leaves a half-written notebook behind.
 *
 * @date 2025
 */

#include "quantlab/sandbox/notebook.hpp"
#include "quantlab/core/session_types.hpp"
#include "quantlab/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>
#include <system_error>

using json = nlohmann::json;

namespace quantlab {
namespace sandbox {

namespace {

const char* const kDefaultIntro =
    "# QuantConnect Research Environment\n"
    "Welcome to the QuantConnect Research Environment. "
    "QuantBook is automatically available as 'qb'.";

const char* const kDefaultSetup =
    "# QuantBook Analysis\n"
    "# Documentation: https://www.quantconnect.com/docs/v2/research-environment\n"
    "\n"
    "from QuantConnect.Configuration import Config\n"
    "\n"
    "Config.Set('data-folder', '/Lean/Data')\n"
    "Config.Set('log-handler', 'ConsoleLogHandler')\n"
    "Config.Set('results-destination-folder', '/LeanCLI')\n"
    "\n"
    "qb = None\n"
    "try:\n"
    "    qb = QuantBook()\n"
    "    print('QuantBook initialized')\n"
    "except Exception as e:\n"
    "    print(f'QuantBook initialization failed: {e}')\n";

Cell CellFromJson(const json& j) {
    if (!j.is_object()) {
        throw core::ArtifactParseError("Notebook cell is not an object");
    }

    Cell cell;
    cell.cell_type = j.value("cell_type", "code");
    cell.kind = cell.cell_type == "code" ? CellKind::CODE : CellKind::NOTE;
    cell.source = Notebook::JoinMultiline(j.value("source", json()));

    if (j.contains("metadata") && j["metadata"].is_object()) {
        cell.metadata = j["metadata"];
    }
    if (j.contains("outputs") && j["outputs"].is_array()) {
        cell.outputs = j["outputs"];
    }
    if (j.contains("execution_count") && j["execution_count"].is_number_integer()) {
        cell.execution_count = j["execution_count"].get<int>();
    }

    return cell;
}

json CellToJson(const Cell& cell) {
    json j;
    j["cell_type"] = cell.cell_type;
    j["metadata"] = cell.metadata;
    j["source"] = Notebook::SplitSource(cell.source);

    if (cell.kind == CellKind::CODE) {
        j["outputs"] = cell.outputs;
        j["execution_count"] = cell.execution_count ? json(*cell.execution_count) : json(nullptr);
    }

    return j;
}

} // anonymous namespace

// ============================================================================
// CODE ERROR
// ============================================================================

std::string CodeError::Format() const {
    std::string message = "Error: " + (ename.empty() ? std::string("Unknown") : ename) + ": " +
                          (evalue.empty() ? std::string("Unknown error") : evalue);
    if (!traceback.empty()) {
        message += "\n" + utils::StringUtils::Join(traceback, "\n");
    }
    return message;
}

CodeError CodeError::FromJson(const json& j) {
    CodeError error;
    error.ename = j.value("ename", "");
    error.evalue = j.value("evalue", "");
    if (j.contains("traceback") && j["traceback"].is_array()) {
        for (const auto& line : j["traceback"]) {
            if (line.is_string()) {
                std::string text = line.get<std::string>();
                if (!text.empty() && text.back() == '\n') {
                    text.pop_back();
                }
                error.traceback.push_back(text);
            }
        }
    }
    return error;
}

// ============================================================================
// CONSTRUCTION AND I/O
// ============================================================================

Notebook Notebook::CreateDefault() {
    Notebook notebook;
    notebook.metadata_ = {
        {"kernelspec", {
            {"display_name", "Python 3"},
            {"language", "python"},
            {"name", "python3"}
        }}
    };
    notebook.AppendNote(kDefaultIntro);
    notebook.AppendCode(kDefaultSetup);
    return notebook;
}

Notebook Notebook::Parse(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object() || !j.contains("cells") || !j["cells"].is_array()) {
            throw core::ArtifactParseError("Notebook has no cell list");
        }

        Notebook notebook;
        for (const auto& cell_json : j["cells"]) {
            notebook.cells_.push_back(CellFromJson(cell_json));
        }
        if (j.contains("metadata") && j["metadata"].is_object()) {
            notebook.metadata_ = j["metadata"];
        }
        notebook.nbformat_ = j.value("nbformat", 4);
        notebook.nbformat_minor_ = j.value("nbformat_minor", 4);
        return notebook;
    }
    catch (const json::exception& e) {
        throw core::ArtifactParseError(std::string("Malformed notebook: ") + e.what());
    }
}

Notebook Notebook::Load(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw core::ArtifactParseError("Cannot open notebook: " + path.string());
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    try {
        return Parse(buffer.str());
    }
    catch (const core::ArtifactParseError& e) {
        throw core::ArtifactParseError(path.string() + ": " + e.what());
    }
}

Notebook Notebook::LoadOrCreate(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::debug("Notebook {} not found, using default skeleton", path.string());
        return CreateDefault();
    }
    return Load(path);
}

void Notebook::Save(const std::filesystem::path& path) const {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::filesystem::path temp_path = path;
    temp_path += ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw std::runtime_error("Cannot write notebook: " + temp_path.string());
        }
        file << Dump(1);
        if (!file) {
            throw std::runtime_error("Failed writing notebook: " + temp_path.string());
        }
    }

    std::filesystem::rename(temp_path, path);
}

// ============================================================================
// CELLS
// ============================================================================

void Notebook::AppendCode(const std::string& code) {
    Cell cell;
    cell.kind = CellKind::CODE;
    cell.cell_type = "code";
    cell.source = code;
    cells_.push_back(std::move(cell));
}

void Notebook::AppendNote(const std::string& text) {
    Cell cell;
    cell.kind = CellKind::NOTE;
    cell.cell_type = "markdown";
    cell.source = text;
    cells_.push_back(std::move(cell));
}

CellOutput Notebook::LastCellOutput() const {
    if (cells_.empty()) {
        return {};
    }
    return CollectOutputs(cells_.back().outputs);
}

// ============================================================================
// SERIALIZATION
// ============================================================================

json Notebook::ToJson() const {
    json cells = json::array();
    for (const auto& cell : cells_) {
        cells.push_back(CellToJson(cell));
    }

    return {
        {"cells", cells},
        {"metadata", metadata_},
        {"nbformat", nbformat_},
        {"nbformat_minor", nbformat_minor_}
    };
}

std::string Notebook::Dump(int indent) const {
    return ToJson().dump(indent);
}

json Notebook::SplitSource(const std::string& text) {
    json lines = json::array();
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t newline = text.find('\n', start);
        if (newline == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, newline - start + 1));
        start = newline + 1;
    }
    return lines;
}

std::string Notebook::JoinMultiline(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }

    std::string joined;
    if (value.is_array()) {
        for (const auto& part : value) {
            if (part.is_string()) {
                joined += part.get<std::string>();
            }
        }
    }
    return joined;
}

CellOutput Notebook::CollectOutputs(const json& outputs) {
    CellOutput result;
    if (!outputs.is_array()) {
        return result;
    }

    for (const auto& output : outputs) {
        if (!output.is_object()) continue;

        std::string output_type = output.value("output_type", "");
        if (output_type == "stream") {
            result.text += JoinMultiline(output.value("text", json()));
        } else if (output_type == "execute_result" || output_type == "display_data") {
            if (output.contains("data") && output["data"].is_object() &&
                output["data"].contains("text/plain")) {
                result.text += JoinMultiline(output["data"]["text/plain"]);
                result.text += "\n";
            }
        } else if (output_type == "error" && !result.error) {
            result.error = CodeError::FromJson(output);
        }
    }

    return result;
}

} // namespace sandbox
} // namespace quantlab
