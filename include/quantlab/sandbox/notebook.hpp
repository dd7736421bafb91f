/**
 * @file notebook.hpp
 * @brief Execution log artifact (nbformat 4 notebook)
 *
 * Each session keeps a research notebook in its workspace. Every submitted
 * payload is appended as a new code cell before it is executed, so the
 * notebook doubles as a persistent log of the session's work that can be
 * opened in the notebook server.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace quantlab {
namespace sandbox {

/**
 * @enum CellKind
 * @brief Notebook cell types quantlab reads and writes
 */
enum class CellKind {
    CODE,   ///< "code" cell
    NOTE    ///< "markdown" or "raw" cell
};

/**
 * @struct Cell
 * @brief One notebook cell
 */
struct Cell {
    CellKind kind{CellKind::CODE};
    std::string cell_type{"code"};                          ///< Original nbformat cell_type
    std::string source;                                     ///< Joined source text
    nlohmann::json outputs = nlohmann::json::array();       ///< Raw nbformat outputs (code cells)
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<int> execution_count;
};

/**
 * @struct CodeError
 * @brief Structured exception raised by user code
 */
struct CodeError {
    std::string ename;                    ///< Exception type
    std::string evalue;                   ///< Exception message
    std::vector<std::string> traceback;   ///< Traceback lines

    /// "Error: <ename>: <evalue>" followed by the traceback
    std::string Format() const;

    static CodeError FromJson(const nlohmann::json& j);
};

/**
 * @struct CellOutput
 * @brief Text collected from a cell's outputs
 */
struct CellOutput {
    std::string text;                 ///< stream + execute_result + display_data text
    std::optional<CodeError> error;   ///< First "error" output, if any
};

/**
 * @class Notebook
 * @brief In-memory nbformat 4 document
 *
 * **Usage Example**:
 * @code
 * auto notebook = Notebook::LoadOrCreate(workspace / "Research" / "research.ipynb");
 * notebook.AppendCode("print(qb.Securities.Count)");
 * notebook.Save(workspace / "Research" / "research.ipynb");
 * @endcode
 */
class Notebook {
public:
    /// Default research notebook: intro markdown + QuantBook setup cell
    static Notebook CreateDefault();

    /**
     * @brief Parse notebook JSON
     * @throws core::ArtifactParseError on malformed JSON or a missing cell list
     */
    static Notebook Parse(const std::string& text);

    /**
     * @brief Read notebook from disk
     * @throws core::ArtifactParseError if the file is unreadable or malformed
     */
    static Notebook Load(const std::filesystem::path& path);

    /**
     * @brief Load, or return CreateDefault() if the file does not exist
     * @throws core::ArtifactParseError if the file exists but is malformed
     */
    static Notebook LoadOrCreate(const std::filesystem::path& path);

    /**
     * @brief Write notebook to disk
     *
     * Written to a sibling temp file first and renamed into place.
     * @throws std::runtime_error on I/O failure
     */
    void Save(const std::filesystem::path& path) const;

    /// Append a code cell holding @p code
    void AppendCode(const std::string& code);

    /// Append a markdown cell
    void AppendNote(const std::string& text);

    const std::vector<Cell>& Cells() const { return cells_; }
    std::size_t CellCount() const { return cells_.size(); }

    /**
     * @brief Collect outputs of the last cell
     * @return Empty CellOutput if the notebook has no cells
     */
    CellOutput LastCellOutput() const;

    nlohmann::json ToJson() const;
    std::string Dump(int indent = 1) const;

    /**
     * @brief Split text into nbformat source lines
     *
     * Every line keeps its trailing "\n" except the last one.
     */
    static nlohmann::json SplitSource(const std::string& text);

    /// Join an nbformat multiline string (array of lines or plain string)
    static std::string JoinMultiline(const nlohmann::json& value);

    /// Collect text and the first error from an nbformat outputs array
    static CellOutput CollectOutputs(const nlohmann::json& outputs);

private:
    std::vector<Cell> cells_;
    nlohmann::json metadata_ = nlohmann::json::object();
    int nbformat_{4};
    int nbformat_minor_{4};
};

} // namespace sandbox
} // namespace quantlab
