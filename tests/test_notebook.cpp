#include "quantlab/core/session_types.hpp"
#include "quantlab/sandbox/notebook.hpp"

#include "test_fakes.hpp"

#include <gtest/gtest.h>

#include <fstream>

using namespace quantlab;
using json = nlohmann::json;

TEST(NotebookTest, DefaultNotebookHasIntroAndSetup) {
    auto notebook = sandbox::Notebook::CreateDefault();
    ASSERT_EQ(2u, notebook.CellCount());
    EXPECT_EQ(sandbox::CellKind::NOTE, notebook.Cells()[0].kind);
    EXPECT_EQ(sandbox::CellKind::CODE, notebook.Cells()[1].kind);
    EXPECT_NE(std::string::npos, notebook.Cells()[1].source.find("qb = QuantBook()"));

    auto j = notebook.ToJson();
    EXPECT_EQ(4, j["nbformat"].get<int>());
    EXPECT_EQ("python3", j["metadata"]["kernelspec"]["name"].get<std::string>());
}

TEST(NotebookTest, SourceIsStoredAsLineArray) {
    auto lines = sandbox::Notebook::SplitSource("a = 1\nprint(a)");
    ASSERT_EQ(2u, lines.size());
    EXPECT_EQ("a = 1\n", lines[0].get<std::string>());
    EXPECT_EQ("print(a)", lines[1].get<std::string>());
    EXPECT_EQ("a = 1\nprint(a)", sandbox::Notebook::JoinMultiline(lines));
    EXPECT_EQ("x", sandbox::Notebook::JoinMultiline(json("x")));
}

TEST(NotebookTest, SaveAndLoadKeepsCells) {
    auto dir = fakes::ScratchDir("nb");
    auto path = dir / "Research" / "research.ipynb";

    auto notebook = sandbox::Notebook::CreateDefault();
    notebook.AppendCode("print('hi')\nprint('there')");
    notebook.Save(path);

    EXPECT_FALSE(std::filesystem::exists(path.string() + ".tmp"));

    auto loaded = sandbox::Notebook::Load(path);
    ASSERT_EQ(3u, loaded.CellCount());
    EXPECT_EQ("print('hi')\nprint('there')", loaded.Cells().back().source);
    EXPECT_EQ(sandbox::CellKind::CODE, loaded.Cells().back().kind);

    std::filesystem::remove_all(dir);
}

TEST(NotebookTest, LoadOrCreateFallsBackToDefault) {
    auto dir = fakes::ScratchDir("nb_missing");
    auto notebook = sandbox::Notebook::LoadOrCreate(dir / "absent.ipynb");
    EXPECT_EQ(2u, notebook.CellCount());
    std::filesystem::remove_all(dir);
}

TEST(NotebookTest, CorruptedNotebookThrows) {
    EXPECT_THROW(sandbox::Notebook::Parse("{not json"), core::ArtifactParseError);
    EXPECT_THROW(sandbox::Notebook::Parse(R"({"cells": 3})"), core::ArtifactParseError);
    EXPECT_THROW(sandbox::Notebook::Parse(R"({"cells": [1]})"), core::ArtifactParseError);

    auto dir = fakes::ScratchDir("nb_bad");
    auto path = dir / "research.ipynb";
    std::ofstream(path) << "garbage";
    EXPECT_THROW(sandbox::Notebook::LoadOrCreate(path), core::ArtifactParseError);
    std::filesystem::remove_all(dir);
}

TEST(NotebookTest, CollectOutputsGathersTextAndFirstError) {
    json outputs = json::parse(R"([
        {"output_type": "stream", "name": "stdout", "text": ["line 1\n", "line 2\n"]},
        {"output_type": "execute_result", "data": {"text/plain": ["42"]}, "execution_count": 1},
        {"output_type": "error", "ename": "ValueError", "evalue": "bad", "traceback": ["tb1\n", "tb2"]},
        {"output_type": "error", "ename": "KeyError", "evalue": "later", "traceback": []}
    ])");

    auto out = sandbox::Notebook::CollectOutputs(outputs);
    EXPECT_EQ("line 1\nline 2\n42\n", out.text);
    ASSERT_TRUE(out.error.has_value());
    EXPECT_EQ("ValueError", out.error->ename);
    EXPECT_EQ("Error: ValueError: bad\ntb1\ntb2", out.error->Format());
}

TEST(NotebookTest, LastCellOutputReadsFinalCell) {
    auto notebook = sandbox::Notebook::Parse(R"({
        "cells": [
            {"cell_type": "code", "source": "1", "outputs": [{"output_type": "stream", "text": "first"}]},
            {"cell_type": "code", "source": "2", "outputs": [{"output_type": "stream", "text": "second"}]}
        ],
        "metadata": {}, "nbformat": 4, "nbformat_minor": 5
    })");

    auto out = notebook.LastCellOutput();
    EXPECT_EQ("second", out.text);
    EXPECT_FALSE(out.error.has_value());
}

TEST(NotebookTest, CodeErrorFormatDefaults) {
    sandbox::CodeError error;
    EXPECT_EQ("Error: Unknown: Unknown error", error.Format());
}
