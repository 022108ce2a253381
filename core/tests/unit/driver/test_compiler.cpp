// tests/unit/driver/test_compiler.cpp - End-to-end compile pipeline
//

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>

#include "eligian/driver/compiler.hpp"
#include "eligian/test_support/memory_assets.hpp"
#include "eligian/test_support/tree_builders.hpp"

using namespace eligian;
using namespace eligian::test_support;

namespace
{

struct TempDir
{
  std::filesystem::path path;
  explicit TempDir(const std::string & name)
  : path(std::filesystem::temp_directory_path() / ("eligian_driver_" + name))
  {
    std::filesystem::remove_all(path);
    std::filesystem::create_directories(path);
  }
  ~TempDir()
  {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
  }
  TempDir(const TempDir &) = delete;
  TempDir & operator=(const TempDir &) = delete;
};

void write_file(const std::filesystem::path & p, const std::string & content)
{
  std::filesystem::create_directories(p.parent_path());
  std::ofstream out(p, std::ios::binary);
  out << content;
}

std::string read_file(const std::filesystem::path & p)
{
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

CompileResult compile_tree(
  const json & tree, const CompileOptions & options = {}, const AssetLoader * loader = nullptr)
{
  JsonSyntaxTreeProvider provider(tree);
  RegistryStore registries;
  return Compiler::compile(provider, registries, options, loader);
}

}  // namespace

// ============================================================================
// In-memory compilation
// ============================================================================

TEST(CompilerTest, CompilesValidDocument)
{
  const auto result = compile_tree(single_timeline({at(t("0s"), t("2s"), call("log", {str("hi")}))}));

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  ASSERT_TRUE(result.ir.has_value());
  ASSERT_TRUE(result.json.has_value());

  const auto doc = json::parse(*result.json);
  EXPECT_EQ(doc["timelines"][0]["timelineActions"][0]["startOperations"][0]["systemName"], "log");
}

TEST(CompilerTest, ValidationErrorsKeepProvisionalOutput)
{
  const auto result = compile_tree(single_timeline({
    at(t("0s"), t("2s"), call("selectElment")),
    at(t("4s"), t("3s"), call("log")),
  }));

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.diagnostics.with_code("UNKNOWN_OPERATION").size(), 1u);
  EXPECT_EQ(result.diagnostics.with_code("TIMING_END_BEFORE_START").size(), 1u);
  ASSERT_TRUE(result.json.has_value());
  EXPECT_EQ(json::parse(*result.json)["timelines"][0]["timelineActions"].size(), 1u)
    << "the reversed interval is optimized away";
}

TEST(CompilerTest, MalformedTreeBecomesTransformError)
{
  json tree = single_timeline({at(t("0s"), t("1s"), call("log"))});
  tree["timelines"][0]["events"].push_back(node("NotAnEvent"));

  const auto result = compile_tree(tree);

  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.json.has_value());
  const auto errors = result.diagnostics.with_code("TRANSFORM_ERROR");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_TRUE(errors[0].help_message.has_value());
}

TEST(CompilerTest, NonFiniteValueBecomesEmitError)
{
  const auto result =
    compile_tree(single_timeline({at(t("0s"), t("1s"), call("wait", {binary(num(1), "/", num(0))}))}));

  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.json.has_value());
  const auto errors = result.diagnostics.with_code("EMIT_ERROR");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].help_message->find("operationData.milliseconds"), std::string::npos);
}

TEST(CompilerTest, StrictModeFailsOnWarnings)
{
  const json tree = program({}, {}, {timeline("main", "raf", "#app", {})});

  const auto lenient = compile_tree(tree);
  EXPECT_TRUE(lenient.success);
  EXPECT_TRUE(lenient.diagnostics.has_warnings());

  CompileOptions strict;
  strict.strict = true;
  EXPECT_FALSE(compile_tree(tree, strict).success);
}

TEST(CompilerTest, LoaderFeedsRegistries)
{
  MemoryAssetLoader assets;
  assets.add("/project/main.css", ".button {} #app {}");
  const json tree = single_timeline(
    {at(t("0s"), t("1s"), call("addClass", {str("buton")}))},
    {default_import("styles", "./main.css"), default_import("labels", "./labels.json")});

  const auto result = compile_tree(tree, {}, &assets);

  EXPECT_EQ(result.diagnostics.with_code("FILE_NOT_FOUND").size(), 1u) << "labels file is missing";
  const auto unknown = result.diagnostics.with_code("UNKNOWN_CSS_CLASS");
  ASSERT_EQ(unknown.size(), 1u);
  EXPECT_EQ(unknown[0].help_message, "Did you mean 'button'?");
}

TEST(CompilerTest, SourcePathOverridesDocumentUri)
{
  MemoryAssetLoader assets;
  assets.add("/elsewhere/main.css", ".button {} #app {}");
  const json tree = single_timeline(
    {at(t("0s"), t("1s"), call("addClass", {str("button")}))}, {default_import("styles", "./main.css")});

  CompileOptions options;
  options.source_path = "/elsewhere/show.eligian";
  const auto result = compile_tree(tree, options, &assets);

  EXPECT_TRUE(result.success);
  EXPECT_TRUE(result.diagnostics.empty());
  ASSERT_TRUE(result.ir.has_value());
  EXPECT_EQ(result.ir->document_uri, "/elsewhere/show.eligian");
}

// ============================================================================
// Files and projects
// ============================================================================

TEST(CompilerTest, OutputName)
{
  EXPECT_EQ(Compiler::output_name("build/intro.eligian.json").string(), "intro.json");
  EXPECT_EQ(Compiler::output_name("tree.json").string(), "tree.json");
}

TEST(CompilerTest, BuildWritesOutputOnSuccessOnly)
{
  TempDir dir("build");
  const std::string uri = "file://" + (dir.path / "show.eligian").generic_string();
  write_file(
    dir.path / "show.eligian.json",
    program({}, {}, {timeline("main", "raf", "#app", {at(t("0s"), t("1s"), call("log"))})}, uri)
      .dump());
  write_file(
    dir.path / "broken.eligian.json",
    program({}, {}, {timeline("main", "raf", "#app", {at(t("0s"), t("1s"), call("nope"))})}, uri)
      .dump());

  CompileOptions options;
  options.output_dir = dir.path / "out";

  const auto ok = Compiler::compile_file(dir.path / "show.eligian.json", options);
  ASSERT_TRUE(ok.success);
  ASSERT_EQ(ok.generated_files.size(), 1u);
  EXPECT_EQ(ok.generated_files[0].string(), (dir.path / "out" / "show.json").string());
  EXPECT_EQ(read_file(ok.generated_files[0]), *ok.json + "\n");

  const auto bad = Compiler::compile_file(dir.path / "broken.eligian.json", options);
  EXPECT_FALSE(bad.success);
  EXPECT_TRUE(bad.generated_files.empty());
  EXPECT_FALSE(std::filesystem::exists(dir.path / "out" / "broken.json"));

  options.mode = CompileMode::Check;
  const auto checked = Compiler::compile_file(dir.path / "show.eligian.json", options);
  EXPECT_TRUE(checked.success);
  EXPECT_TRUE(checked.generated_files.empty());
}

TEST(CompilerTest, UncreatableOutputDirectoryIsReported)
{
  TempDir dir("blocked");
  const std::string uri = "file://" + (dir.path / "show.eligian").generic_string();
  write_file(
    dir.path / "show.eligian.json",
    program({}, {}, {timeline("main", "raf", "#app", {at(t("0s"), t("1s"), call("log"))})}, uri)
      .dump());
  write_file(dir.path / "occupied", "a file, not a directory");

  CompileOptions options;
  options.output_dir = dir.path / "occupied" / "out";

  const auto result = Compiler::compile_file(dir.path / "show.eligian.json", options);

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.generated_files.empty());
  const auto errors = result.diagnostics.with_code("OUTPUT_ERROR");
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].message.find("failed to create output directory"), std::string::npos);
}

TEST(CompilerTest, MissingTreeFile)
{
  const auto result = Compiler::compile_file("/nonexistent/tree.json", {});

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_errors());
}

TEST(CompilerTest, ProjectCompilesEveryEntryPoint)
{
  TempDir dir("project");
  for (const std::string name : {"intro", "outro"}) {
    const std::string uri = "file://" + (dir.path / "src" / (name + ".eligian")).generic_string();
    write_file(
      dir.path / "build" / (name + ".eligian.json"),
      program({}, {}, {timeline("main", "raf", "#app", {at(t("0s"), t("1s"), call("log"))})}, uri)
        .dump());
  }

  ProjectConfig config;
  config.project_root = dir.path;
  config.compiler.entry_points = {"build/intro.eligian.json", "build/outro.eligian.json"};
  config.compiler.indent = 0;

  const auto result = Compiler::compile_project(config, {});

  ASSERT_TRUE(result.success);
  ASSERT_EQ(result.generated_files.size(), 2u);
  EXPECT_TRUE(std::filesystem::exists(dir.path / "dist" / "intro.json"));
  EXPECT_TRUE(std::filesystem::exists(dir.path / "dist" / "outro.json"));
  EXPECT_EQ(read_file(dir.path / "dist" / "intro.json").find("\n  "), std::string::npos)
    << "project indent 0 writes compact JSON";
}

TEST(CompilerTest, ProjectWithoutEntryPointsFails)
{
  ProjectConfig config;
  config.project_root = "/tmp";

  const auto result = Compiler::compile_project(config, {});

  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.diagnostics.has_errors());
}
