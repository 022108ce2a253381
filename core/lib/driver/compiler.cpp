// eligian/driver/compiler.cpp - Compiler driver implementation
//
#include "eligian/driver/compiler.hpp"

#include <fmt/core.h>
#include <fstream>
#include <system_error>

#include "eligian/basic/errors.hpp"
#include "eligian/codegen/json_emitter.hpp"
#include "eligian/ir/import_graph.hpp"
#include "eligian/lowering/ast_lowering.hpp"
#include "eligian/opt/optimizer.hpp"
#include "eligian/registry/registry_loader.hpp"
#include "eligian/sema/validator.hpp"

namespace eligian
{

namespace
{

/// Same imports, different document URI
ImportGraph rebase(const ImportGraph & graph, const std::string & document_uri)
{
  ImportGraph out(document_uri);
  for (const auto & ref : graph.imports()) {
    out.add(ref);
  }
  return out;
}

}  // namespace

CompileResult Compiler::compile(
  SyntaxTreeProvider & provider, RegistryStore & registries, const CompileOptions & options,
  const AssetLoader * loader)
{
  CompileResult result;
  AstContext ctx;

  try {
    const Program * program = provider.provide(ctx);
    if (program == nullptr) {
      result.diagnostics.report_error(SourceRange{}, "syntax tree provider returned no program")
        .with_code("TRANSFORM_ERROR");
      return result;
    }

    ImportGraph graph = ImportGraph::from_program(*program);
    if (options.source_path) {
      graph = rebase(graph, *options.source_path);
    }

    if (loader != nullptr) {
      result.diagnostics.merge(RegistryLoader::load(graph, *loader, registries));
    }

    ir::ConfigIR config = lower_program(*program);
    if (options.source_path) {
      config.document_uri = *options.source_path;
    }

    result.diagnostics.merge(validate(config, graph, registries));
    result.ir = optimize(config);
  } catch (const TransformError & e) {
    result.diagnostics.report_error(e.range(), e.what())
      .with_code("TRANSFORM_ERROR")
      .with_help("The syntax tree does not match what the compiler expects");
    return result;
  }

  try {
    result.json = emit(*result.ir, EmitOptions{options.indent});
  } catch (const EmitError & e) {
    result.diagnostics.report_error(SourceRange{}, e.what())
      .with_code("EMIT_ERROR")
      .with_help("Check the value at " + e.field_path());
  }

  result.success = result.json.has_value() && is_success(result.diagnostics, options.strict);
  return result;
}

CompileResult Compiler::compile_file(
  const std::filesystem::path & tree_file, const CompileOptions & options)
{
  RegistryStore registries;
  const std::filesystem::path output_dir =
    options.output_dir.value_or(tree_file.parent_path());
  return compile_file_into(tree_file, options, output_dir, registries);
}

CompileResult Compiler::compile_project(
  const ProjectConfig & config, const CompileOptions & options)
{
  CompileResult result;

  namespace fs = std::filesystem;

  // Handle empty entry points
  if (config.compiler.entry_points.empty()) {
    result.diagnostics.report_error(
      SourceRange{}, "no entry points defined in project configuration");
    return result;
  }

  const fs::path output_dir =
    options.output_dir.value_or(config.project_root / config.compiler.output_dir);

  CompileOptions entry_options = options;
  entry_options.indent = config.compiler.indent;
  entry_options.strict = options.strict || config.compiler.strict;
  // A single --source only makes sense for a single file
  entry_options.source_path.reset();

  // Entry points share one store; each document records its own imports
  RegistryStore registries;
  bool all_ok = true;
  for (const auto & entry_rel : config.compiler.entry_points) {
    const fs::path entry_path = config.project_root / entry_rel;
    CompileResult entry = compile_file_into(entry_path, entry_options, output_dir, registries);

    all_ok = all_ok && entry.success;
    result.diagnostics.merge(std::move(entry.diagnostics));
    result.generated_files.insert(
      result.generated_files.end(), entry.generated_files.begin(), entry.generated_files.end());
  }

  result.success = all_ok;
  return result;
}

std::filesystem::path Compiler::output_name(const std::filesystem::path & tree_file)
{
  std::filesystem::path stem = tree_file.stem();
  if (stem.has_extension()) {
    stem = stem.stem();
  }
  return stem.string() + ".json";
}

CompileResult Compiler::compile_file_into(
  const std::filesystem::path & tree_file, const CompileOptions & options,
  const std::filesystem::path & output_dir, RegistryStore & registries)
{
  namespace fs = std::filesystem;

  CompileResult result;
  if (!fs::exists(tree_file)) {
    result.diagnostics.report_error(SourceRange{}, "file not found: " + tree_file.string());
    return result;
  }

  if (options.verbose) {
    fmt::print(stderr, "Compiling {}\n", tree_file.string());
  }

  FileSystemAssetLoader loader;
  try {
    JsonSyntaxTreeProvider provider = JsonSyntaxTreeProvider::from_file(tree_file);
    result = compile(provider, registries, options, &loader);
  } catch (const TransformError & e) {
    result.diagnostics.report_error(e.range(), e.what()).with_code("TRANSFORM_ERROR");
    return result;
  }

  if (options.mode == CompileMode::Build && result.success && result.json) {
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
      result.diagnostics
        .report_error(
          SourceRange{}, fmt::format("failed to create output directory {}: {}",
                                     output_dir.string(), ec.message()))
        .with_code("OUTPUT_ERROR");
      result.success = false;
      return result;
    }
    const fs::path output_path = output_dir / output_name(tree_file);
    if (write_output(*result.json, output_path, result.diagnostics)) {
      result.generated_files.push_back(output_path);
    } else {
      result.success = false;
    }
  }

  return result;
}

bool Compiler::write_output(
  const std::string & json, const std::filesystem::path & output_path, DiagnosticBag & diags)
{
  std::ofstream out(output_path);
  if (!out.is_open()) {
    diags.report_error(SourceRange{}, "failed to open output file: " + output_path.string());
    return false;
  }

  out << json << '\n';
  return true;
}

bool Compiler::is_success(const DiagnosticBag & diags, bool strict)
{
  return !diags.has_errors() && !(strict && diags.has_warnings());
}

}  // namespace eligian
