#include <gtest/gtest.h>
#include <cstdio>
#include <iomanip>
#include <ios>
#include <memory>
#include <sstream>
#include <string>

#include "Boundaries.hpp"
#include "Errors.hpp"
#include "HeatExchangers.hpp"
#include "IF97Water.hpp"
#include "Network.hpp"
#include "ResultsWriter.hpp"
#include "Turbomachinery.hpp"
#include "hdf5_utils.hpp"

using namespace kadmos::network;

namespace {

// Water backend whose quality lookup always fails
class NoQualityWater : public IF97Water {
public:
    double quality(double /*p*/, double /*h*/) const override {
        throw PropertyRangeError("quality unavailable");
    }
};

// Feedwater train with hand-set states; nothing is solved here
struct FeedTrain {
    Network net;
    SolveResult result;

    explicit FeedTrain(std::shared_ptr<WaterProperties> props = std::make_shared<IF97Water>())
        : net(props)
    {
        auto source = net.addComponent(std::make_shared<Source>("source", 100.0, 1.0e5, 4.0e5));
        PumpParameters pp;
        pp.p_out = 7.0e6;
        auto pump = net.addComponent(std::make_shared<Pump>("pump", pp));
        HeaterParameters hp;
        hp.target = OutletTarget::fromTemperature(520.0);
        auto heater = net.addComponent(std::make_shared<Heater>("heater", hp));
        auto sink = net.addComponent(std::make_shared<Sink>("sink"));

        auto feed = net.connect(*source, "out", *pump, "in", "c_feed", {100.0, 1.0e5, 4.0e5});
        net.connect(*pump, "out", *heater, "in", "c_pumped", {100.0, 7.0e6, 4.1e5});
        net.connect(*heater, "out", *sink, "in", "c_hot", {100.0, 7.0e6, 1.1e6});
        feed->fix(std::nullopt, 1.0e5);

        result.converged = true;
        result.status = SolveStatus::Converged;
        result.message = "Converged (residual norm)";
        result.iterations = 3;
        result.residual_norm = 4.0e-9;
        result.residual_history = {1.0, 1.0e-3, 4.0e-9};
    }
};

} // namespace

TEST(ResultsWriterTest, DutiesFollowComponentOrder) {
    FeedTrain train;
    ResultsWriter writer(train.net, train.result);

    std::vector<ComponentDuty> duties = writer.duties();
    ASSERT_EQ(duties.size(), 2);
    EXPECT_EQ(duties[0].component, "pump");
    EXPECT_EQ(duties[0].quantity, "shaft_power");
    EXPECT_NEAR(duties[0].value, 100.0 * 1.0e4, 1e-6);
    EXPECT_EQ(duties[1].component, "heater");
    EXPECT_EQ(duties[1].quantity, "heat_added");
    EXPECT_NEAR(duties[1].value, 100.0 * 6.9e5, 1e-3);
}

TEST(ResultsWriterTest, PrintReport) {
    FeedTrain train;
    ResultsWriter writer(train.net, train.result);

    std::ostringstream out;
    writer.printReport(out);
    std::string text = out.str();

    EXPECT_NE(text.find("Status: Converged (Converged (residual norm))"), std::string::npos);
    EXPECT_NE(text.find("Iterations: 3"), std::string::npos);
    EXPECT_NE(text.find("c_pumped"), std::string::npos);
    EXPECT_NE(text.find("Component duties:"), std::string::npos);
    EXPECT_NE(text.find("heater heat_added [W]:"), std::string::npos);
}

TEST(ResultsWriterTest, PrintReportKeepsStreamFormat) {
    FeedTrain train;
    ResultsWriter writer(train.net, train.result);

    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << std::setfill('*');
    const std::ios::fmtflags flags = out.flags();
    writer.printReport(out);

    EXPECT_EQ(out.flags(), flags);
    EXPECT_EQ(out.precision(), 2);
    EXPECT_EQ(out.fill(), '*');

    out.str("");
    out << 1.0 / 3.0;
    EXPECT_EQ(out.str(), "0.33");
}

TEST(ResultsWriterTest, PropertyFailureLeavesStreamFormat) {
    FeedTrain train(std::make_shared<NoQualityWater>());
    ResultsWriter writer(train.net, train.result);

    std::ostringstream out;
    const std::ios::fmtflags flags = out.flags();
    const std::streamsize precision = out.precision();
    EXPECT_THROW(writer.printReport(out), PropertyRangeError);
    EXPECT_EQ(out.flags(), flags);
    EXPECT_EQ(out.precision(), precision);
}

TEST(ResultsWriterTest, WriteHDF5) {
    FeedTrain train;
    ResultsWriter writer(train.net, train.result);
    const std::string filename = ::testing::TempDir() + "results_writer.h5";

    writer.writeHDF5(filename);

    std::vector<std::string> names = read_hdf5_strings(filename, "/connections/names");
    ASSERT_EQ(names.size(), 3);
    EXPECT_EQ(names[0], "c_feed");
    EXPECT_EQ(names[2], "c_hot");

    FlatHDF5Data p = read_flat_hdf5_dataset(filename, "/connections/p");
    ASSERT_EQ(p.shape.size(), 1);
    EXPECT_DOUBLE_EQ(p[1], 7.0e6);

    FlatHDF5Data fixed = read_flat_hdf5_dataset(filename, "/connections/fixed");
    ASSERT_EQ(fixed.shape.size(), 2);
    EXPECT_EQ(fixed.shape[0], 3);
    EXPECT_EQ(fixed.shape[1], 3);
    EXPECT_DOUBLE_EQ(fixed[0], 0.0);
    EXPECT_DOUBLE_EQ(fixed[1], 1.0);
    EXPECT_DOUBLE_EQ(fixed[4], 0.0);

    std::vector<std::string> types = read_hdf5_strings(filename, "/components/types");
    ASSERT_EQ(types.size(), 4);
    EXPECT_EQ(types[1], "Pump");

    FlatHDF5Data duties = read_flat_hdf5_dataset(filename, "/duties/values");
    ASSERT_EQ(duties.data.size(), 2);
    EXPECT_NEAR(duties[0], 1.0e6, 1e-6);

    EXPECT_DOUBLE_EQ(read_hdf5_scalar(filename, "/solve/converged"), 1.0);
    EXPECT_DOUBLE_EQ(read_hdf5_scalar(filename, "/solve/iterations"), 3.0);
    EXPECT_EQ(read_hdf5_strings(filename, "/solve/status")[0], "Converged");
    FlatHDF5Data history = read_flat_hdf5_dataset(filename, "/solve/residual_history");
    ASSERT_EQ(history.data.size(), 3);
    EXPECT_DOUBLE_EQ(history[2], 4.0e-9);

    std::remove(filename.c_str());
}

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
