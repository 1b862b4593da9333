#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>
#include <string>

#include "Boundaries.hpp"
#include "FlowComponents.hpp"
#include "IF97Water.hpp"
#include "Network.hpp"

using namespace kadmos::network;

namespace {

struct PipeLine {
    Network net;
    std::shared_ptr<Source> source;
    std::shared_ptr<Pipe> pipe;
    std::shared_ptr<CoreChannel> core;
    std::shared_ptr<Sink> sink;

    PipeLine() {
        source = net.addComponent(std::make_shared<Source>("source", 10.0, 7.0e6, 1.0e6));
        pipe = net.addComponent(std::make_shared<Pipe>("pipe"));
        core = net.addComponent(std::make_shared<CoreChannel>("core"));
        sink = net.addComponent(std::make_shared<Sink>("sink"));

        net.connect(*source, "out", *pipe, "in", "c1", {10.0, 7.0e6, 1.0e6});
        net.connect(*pipe, "out", *core, "in", "c2", {10.0, 6.99e6, 1.0e6});
        net.connect(*core, "out", *sink, "in", "c3", {10.0, 6.98e6, 1.1e6});
    }
};

} // namespace

TEST(NetworkTest, DefaultPropertiesAreIF97) {
    Network net;
    ASSERT_NE(net.propertiesPtr(), nullptr);
    EXPECT_NE(std::dynamic_pointer_cast<IF97Water>(net.propertiesPtr()), nullptr);

    auto shared = std::make_shared<IF97Water>(32);
    Network custom(shared);
    EXPECT_EQ(custom.propertiesPtr(), shared);
    EXPECT_EQ(&custom.properties(), shared.get());
}

TEST(NetworkTest, ConnectWiresBothPorts) {
    PipeLine line;

    ASSERT_EQ(line.net.connections().size(), 3);
    EXPECT_TRUE(line.net.hasConnection("c2"));
    EXPECT_FALSE(line.net.hasConnection("c4"));

    Connection& c2 = line.net.connection("c2");
    EXPECT_EQ(line.pipe->outlets().at("out").get(), &c2);
    EXPECT_EQ(line.core->inlets().at("in").get(), &c2);
    EXPECT_DOUBLE_EQ(c2.p().value(), 6.99e6);

    EXPECT_EQ(line.net.component("core"), line.core);
    EXPECT_EQ(line.net.component("missing"), nullptr);
    EXPECT_THROW(line.net.connection("missing"), std::out_of_range);
}

TEST(NetworkTest, DuplicateNamesAreRejected) {
    PipeLine line;

    EXPECT_THROW(line.net.addConnection(std::make_shared<Connection>("c1")), ConfigurationException);
    EXPECT_THROW(line.net.connect(*line.source, "out", *line.pipe, "in", "c2"), ConfigurationException);
    EXPECT_THROW(line.net.addComponent(std::make_shared<Pipe>("pipe")), ConfigurationException);
    EXPECT_EQ(line.net.connections().size(), 3);
    EXPECT_EQ(line.net.components().size(), 4);

    EXPECT_THROW(line.net.addConnection(nullptr), std::invalid_argument);
}

TEST(NetworkTest, BoundPortsAreRejected) {
    PipeLine line;
    auto bypass = line.net.addComponent(std::make_shared<Pipe>("bypass"));

    // pipe.out already carries c2
    try {
        line.net.connect(*line.pipe, "out", *bypass, "in", "c4");
        FAIL() << "expected ConfigurationException";
    } catch (const ConfigurationException& e) {
        ASSERT_EQ(e.errors().size(), 1);
        EXPECT_EQ(e.errors()[0].component, "pipe");
        EXPECT_EQ(e.errors()[0].item, "out");
        EXPECT_NE(e.errors()[0].reason.find("'c2'"), std::string::npos);
    }

    // core.in already carries c2
    EXPECT_THROW(line.net.connect(*bypass, "out", *line.core, "in", "c5"), ConfigurationException);

    // Nothing was added or rewired
    EXPECT_EQ(line.net.connections().size(), 3);
    EXPECT_FALSE(line.net.hasConnection("c4"));
    EXPECT_EQ(line.pipe->outlets().at("out").get(), &line.net.connection("c2"));
    EXPECT_EQ(line.core->inlets().at("in").get(), &line.net.connection("c2"));
    EXPECT_TRUE(bypass->inlets().empty());
    EXPECT_EQ(line.net.freeVariables().size(), 9);
}

TEST(NetworkTest, VariableOrdering) {
    PipeLine line;

    std::vector<Variable*> vars = line.net.allVariables();
    ASSERT_EQ(vars.size(), 10);
    EXPECT_EQ(vars[0]->name(), "c1.m");
    EXPECT_EQ(vars[1]->name(), "c1.p");
    EXPECT_EQ(vars[2]->name(), "c1.h");
    EXPECT_EQ(vars[8]->name(), "c3.h");
    EXPECT_EQ(vars[9]->name(), "core.Q");

    // The fixed-power core keeps its duty out of the unknowns
    EXPECT_EQ(line.net.freeVariables().size(), 9);

    line.net.connection("c1").fix(std::nullopt, 7.0e6);
    line.core->setExitVoidFraction(0.1, 1.0e6);
    std::vector<Variable*> free_vars = line.net.freeVariables();
    ASSERT_EQ(free_vars.size(), 9);
    EXPECT_EQ(free_vars[0]->name(), "c1.m");
    EXPECT_EQ(free_vars[1]->name(), "c1.h");
    EXPECT_EQ(free_vars.back()->name(), "core.Q");
}

TEST(NetworkTest, EquationsFollowComponentOrder) {
    PipeLine line;

    std::vector<Equation> eqs = line.net.equations();
    ASSERT_EQ(eqs.size(), 3 + 3 + 3 + 0);
    EXPECT_EQ(eqs[0].name, "source.m_out");
    EXPECT_EQ(eqs[3].name, "pipe.mass");
    EXPECT_EQ(eqs[6].name, "core.mass");
    EXPECT_EQ(eqs[8].name, "core.dp");
}

TEST(NetworkTest, ValidateCollectsEveryComponent) {
    Network net;
    auto pipe = net.addComponent(std::make_shared<Pipe>("pipe"));
    PipeParameters bad;
    bad.L = -1.0;
    auto riser = net.addComponent(std::make_shared<Pipe>("riser", bad));
    net.connect(*pipe, "out", *riser, "in", "c");

    std::vector<ConfigurationError> errors = net.validate();
    ASSERT_EQ(errors.size(), 3);
    EXPECT_EQ(errors[0].component, "pipe");
    EXPECT_EQ(errors[0].item, "in");
    EXPECT_EQ(errors[1].component, "riser");
    EXPECT_EQ(errors[1].item, "out");
    EXPECT_EQ(errors[2].item, "L");

    EXPECT_THROW(net.equations(), PortNotConnected);
}

TEST(NetworkTest, Summary) {
    PipeLine line;
    line.net.connection("c3").fix(std::nullopt, 6.98e6);

    std::string text = line.net.summary();
    EXPECT_NE(text.find("Network with 4 components and 3 connections"), std::string::npos);
    EXPECT_NE(text.find("  - c1: m=10"), std::string::npos);
    EXPECT_NE(text.find("p=6.98e+06 (fixed)"), std::string::npos);
    EXPECT_EQ(text.find("m=10 (fixed)"), std::string::npos);
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
