#include "quantlab/utils/container_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>

using namespace quantlab::utils;

namespace {

bool HasPair(const std::vector<std::string>& args, const std::string& flag, const std::string& value) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
        if (args[i] == flag && args[i + 1] == value) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST(DockerRuntimeTest, ParseListOutput) {
    const std::string output =
        R"({"ID":"a1b2c3","Names":"lean_cli_research","Image":"quantconnect/research:latest",)"
        R"("State":"running","Labels":"quantlab.session_id=default,other=x",)"
        R"("Ports":"0.0.0.0:8888->8888/tcp, :::8888->8888/tcp"})" "\n"
        "not json\n"
        R"({"ID":"d4e5f6","Names":"idle","Image":"busybox","State":"exited","Labels":"","Ports":""})" "\n";

    auto containers = DockerRuntime::ParseListOutput(output);
    ASSERT_EQ(2u, containers.size());

    const auto& first = containers[0];
    EXPECT_EQ("a1b2c3", first.id);
    EXPECT_EQ("lean_cli_research", first.name);
    EXPECT_EQ(ContainerState::RUNNING, first.state);
    EXPECT_EQ("default", first.labels.at("quantlab.session_id"));
    ASSERT_EQ(1u, first.port_mappings.size());
    EXPECT_EQ(8888, first.port_mappings.at(8888));

    EXPECT_EQ(ContainerState::EXITED, containers[1].state);
    EXPECT_TRUE(containers[1].labels.empty());
}

TEST(DockerRuntimeTest, ParsePortsSkipsRangesAndUnpublished) {
    auto ports = DockerRuntime::ParsePorts("8080/tcp, 0.0.0.0:9000-9001->9000-9001/tcp, 127.0.0.1:8890->8888/tcp");
    ASSERT_EQ(1u, ports.size());
    EXPECT_EQ(8888, ports.at(8890));
}

TEST(DockerRuntimeTest, ParseLabelsKeepsEqualsInValue) {
    auto labels = DockerRuntime::ParseLabels("a=1,b=x=y,flag");
    EXPECT_EQ("1", labels.at("a"));
    EXPECT_EQ("x=y", labels.at("b"));
    EXPECT_EQ("", labels.at("flag"));
}

TEST(DockerRuntimeTest, StateRoundTrip) {
    EXPECT_EQ(ContainerState::PAUSED, DockerRuntime::ParseState("Paused"));
    EXPECT_EQ(ContainerState::UNKNOWN, DockerRuntime::ParseState("weird"));
    EXPECT_EQ("dead", DockerRuntime::StateToString(ContainerState::DEAD));
}

TEST(DockerRuntimeTest, MissingContainerDetection) {
    EXPECT_TRUE(DockerRuntime::IndicatesMissingContainer("Error: No such container: abc"));
    EXPECT_TRUE(DockerRuntime::IndicatesMissingContainer("Container abc is not running"));
    EXPECT_FALSE(DockerRuntime::IndicatesMissingContainer("permission denied"));
}

TEST(DockerRuntimeTest, BuildRunCommand) {
    auto config = ContainerBuilder()
                      .WithName("qc_research_x")
                      .WithImage("quantconnect/research:latest")
                      .WithMemoryLimit(4096)
                      .WithCPULimit(1.5)
                      .WithPort(8890, 8888)
                      .WithMount("/tmp/ws/Research", "/LeanCLI")
                      .WithEnvironment("LEAN_ENGINE", "true")
                      .WithLabel("quantlab.session_id", "x")
                      .WithWorkingDir("/LeanCLI")
                      .Build();

    auto args = DockerRuntime::BuildRunCommand(config);
    ASSERT_GE(args.size(), 2u);
    EXPECT_EQ("run", args[0]);
    EXPECT_EQ("-d", args[1]);
    EXPECT_TRUE(HasPair(args, "--name", "qc_research_x"));
    EXPECT_TRUE(HasPair(args, "--memory", "4096m"));
    EXPECT_TRUE(HasPair(args, "--cpus", "1.5"));
    EXPECT_TRUE(HasPair(args, "-p", "8890:8888"));
    EXPECT_TRUE(HasPair(args, "-v", "/tmp/ws/Research:/LeanCLI"));
    EXPECT_TRUE(HasPair(args, "-e", "LEAN_ENGINE=true"));
    EXPECT_TRUE(HasPair(args, "--label", "quantlab.session_id=x"));
    EXPECT_TRUE(HasPair(args, "-w", "/LeanCLI"));
    EXPECT_NE(args.end(), std::find(args.begin(), args.end(), "--rm"));
    EXPECT_EQ("quantconnect/research:latest", args.back());
}

TEST(DockerRuntimeTest, DefaultRunCommandIsMinimal) {
    auto args = DockerRuntime::BuildRunCommand(ContainerBuilder().WithName("qc_research_y").Build());
    std::vector<std::string> expected = {
        "run", "-d",
        "--name", "qc_research_y",
        "--memory", "2048m",
        "--cpus", "1",
        "--rm",
        "quantconnect/research:latest"
    };
    EXPECT_EQ(expected, args);
}

TEST(DockerRuntimeTest, NoNetworkFlagForBridge) {
    auto args = DockerRuntime::BuildRunCommand(ContainerBuilder().WithNetwork(NetworkMode::BRIDGE).Build());
    EXPECT_EQ(args.end(), std::find(args.begin(), args.end(), "--network"));

    args = DockerRuntime::BuildRunCommand(ContainerBuilder().WithNetwork(NetworkMode::NONE).Build());
    EXPECT_TRUE(HasPair(args, "--network", "none"));
}
