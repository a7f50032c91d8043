#include <dropshade/engine/engine.h>
#include <dropshade/image/codec.h>
#include <dropshade/io/byte_stream.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <filesystem>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace dropshade;
using core::LifecycleStage;

namespace {

std::size_t count_severity(const core::DiagnosticEmitter& emitter, core::Severity severity) {
    const auto& events = emitter.events();
    return static_cast<std::size_t>(
        std::count_if(events.begin(), events.end(),
                      [severity](const core::DiagnosticEvent& e) { return e.severity == severity; }));
}

std::vector<std::uint8_t> red_square_png(int size) {
    image::Raster raster(size, size);
    raster.clear({255, 0, 0, 255});
    return image::encode_image(raster).bytes;
}

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() /
            ("dropshade_engine_" + std::to_string(::getpid()) + "_" + name)).string();
}

}  // namespace

TEST(EngineTest, ProcessProducesDecodablePng) {
    core::DiagnosticEmitter diagnostics;
    engine::ShadowEngine engine(diagnostics);

    auto result = engine.process(red_square_png(100), engine::PipelineConfig{});
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.input_format, image::ImageFormat::Png);
    EXPECT_EQ(image::detect_format(result.encoded), image::ImageFormat::Png);

    auto decoded = image::decode_image(result.encoded);
    ASSERT_TRUE(decoded.ok);
    EXPECT_EQ(decoded.raster, result.output);
    EXPECT_GT(decoded.raster.width(), 100);
    EXPECT_EQ(result.trace.last_stage(), LifecycleStage::Complete);
}

TEST(EngineTest, ProcessTraceCoversEveryStage) {
    core::DiagnosticEmitter diagnostics;
    engine::ShadowEngine engine(diagnostics);
    auto result = engine.process(red_square_png(20), engine::PipelineConfig{});
    ASSERT_TRUE(result.ok);

    std::vector<LifecycleStage> stages;
    for (const auto& entry : result.trace.entries) stages.push_back(entry.stage);
    const std::vector<LifecycleStage> expected = {
        LifecycleStage::Idle, LifecycleStage::Decoding, LifecycleStage::Rounding,
        LifecycleStage::Shadowing, LifecycleStage::Compositing, LifecycleStage::Encoding,
        LifecycleStage::Complete};
    EXPECT_EQ(stages, expected);
}

TEST(EngineTest, VerboseDiagnosticsMentionFormatAndSize) {
    core::DiagnosticEmitter diagnostics;
    engine::ShadowEngine engine(diagnostics);
    auto input = red_square_png(10);
    ASSERT_TRUE(engine.process(input, engine::PipelineConfig{}).ok);

    bool saw_format = false;
    bool saw_size = false;
    for (const auto& event : diagnostics.events()) {
        if (event.message == "guessed image format: png") saw_format = true;
        if (event.message == "input data size: " + std::to_string(input.size()) + " bytes") {
            saw_size = true;
        }
    }
    EXPECT_TRUE(saw_format);
    EXPECT_TRUE(saw_size);
}

TEST(EngineTest, RunReadsStdinAndWritesStdout) {
    core::DiagnosticEmitter diagnostics;
    engine::ShadowEngine engine(diagnostics);

    const auto png = red_square_png(16);
    std::istringstream in(std::string(png.begin(), png.end()));
    std::ostringstream out;

    auto result = engine.run(cli::Options{}, in, out);
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_TRUE(result.message.empty());
    const std::string written = out.str();
    ASSERT_EQ(written.size(), result.encoded.size());
    EXPECT_EQ(static_cast<unsigned char>(written[0]), 0x89);
    EXPECT_EQ(result.trace.last_stage(), LifecycleStage::Complete);
    EXPECT_TRUE(result.trace.contains(LifecycleStage::Reading));
    EXPECT_TRUE(result.trace.contains(LifecycleStage::Writing));
}

TEST(EngineTest, EmptyStdinIsReported) {
    core::DiagnosticEmitter diagnostics;
    engine::ShadowEngine engine(diagnostics);
    std::istringstream in("");
    std::ostringstream out;

    auto result = engine.run(cli::Options{}, in, out);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.code, core::ErrorCode::EmptyInput);
    EXPECT_NE(result.message.find("No input data received"), std::string::npos);
    EXPECT_TRUE(out.str().empty());
    EXPECT_EQ(result.trace.last_stage(), LifecycleStage::Error);
    EXPECT_EQ(count_severity(diagnostics, core::Severity::Error), 1u);
}

TEST(EngineTest, UndecodableInputFails) {
    core::DiagnosticEmitter diagnostics;
    engine::ShadowEngine engine(diagnostics);
    std::istringstream in("this is plain text, not pixels");
    std::ostringstream out;

    auto result = engine.run(cli::Options{}, in, out);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.code, core::ErrorCode::UnsupportedFormat);
    EXPECT_TRUE(out.str().empty());
}

TEST(EngineTest, FileInputAndOutput) {
    const std::string input_path = temp_path("in.png");
    const std::string output_path = temp_path("out.bmp");
    ASSERT_FALSE(io::write_file(input_path, red_square_png(24)).is_error());

    cli::Options options;
    options.input_path = input_path;
    options.output_path = output_path;

    core::DiagnosticEmitter diagnostics;
    engine::ShadowEngine engine(diagnostics);
    std::istringstream unused_in;
    std::ostringstream unused_out;
    auto result = engine.run(options, unused_in, unused_out);
    ASSERT_TRUE(result.ok) << result.message;
    EXPECT_EQ(result.message,
              "Image with rounded corners and drop shadow saved as: " + output_path);
    EXPECT_TRUE(unused_out.str().empty());

    auto written = io::read_file(output_path);
    ASSERT_TRUE(written.ok);
    EXPECT_EQ(image::detect_format(written.bytes), image::ImageFormat::Bmp);

    std::filesystem::remove(input_path);
    std::filesystem::remove(output_path);
}

TEST(EngineTest, MissingInputFile) {
    cli::Options options;
    options.input_path = temp_path("missing.png");
    core::DiagnosticEmitter diagnostics;
    engine::ShadowEngine engine(diagnostics);
    std::istringstream in;
    std::ostringstream out;
    auto result = engine.run(options, in, out);
    EXPECT_FALSE(result.ok);
    EXPECT_EQ(result.error.code, core::ErrorCode::ReadFailed);
}

TEST(EngineTest, EachRunGetsItsOwnRunId) {
    core::DiagnosticEmitter diagnostics;
    engine::ShadowEngine engine(diagnostics);
    ASSERT_TRUE(engine.process(red_square_png(8), engine::PipelineConfig{}).ok);
    const auto first = diagnostics.run_id();
    ASSERT_TRUE(engine.process(red_square_png(8), engine::PipelineConfig{}).ok);
    EXPECT_EQ(diagnostics.run_id(), first + 1);
    EXPECT_EQ(engine.trace().last_stage(), LifecycleStage::Complete);

    const auto& last = diagnostics.events().back();
    EXPECT_EQ(last.run_id, first + 1);
    EXPECT_EQ(last.stage, "complete");
    EXPECT_EQ(last.message.rfind("finished in ", 0), 0u);
}
