#pragma once

#include <string>
#include <vector>

#include <slang/ast/Compilation.h>
#include <slang/parsing/Lexer.h>
#include <slang/parsing/Preprocessor.h>
#include <slang/util/Bag.h>

namespace defnav::analysis {

// Project settings that affect how documents are parsed
struct AnalysisOptions {
  // Macro definitions, NAME or NAME=value
  std::vector<std::string> defines;

  // Absolute directories searched by `include
  std::vector<std::string> include_dirs;
};

// Language-server compilation options: no implicit nets, unlimited errors,
// maximum compatibility flags, plus the project defines and include paths.
inline auto CreateCompilationOptions(const AnalysisOptions& analysis)
    -> slang::Bag {
  slang::Bag options;

  slang::parsing::PreprocessorOptions pp_options;
  pp_options.initialDefaultNetType = slang::parsing::TokenKind::Unknown;
  for (const auto& define : analysis.defines) {
    pp_options.predefines.push_back(define);
  }
  for (const auto& dir : analysis.include_dirs) {
    pp_options.additionalIncludePaths.emplace_back(dir);
  }
  options.set(pp_options);

  slang::parsing::LexerOptions lexer_options;
  lexer_options.enableLegacyProtect = true;
  options.set(lexer_options);

  slang::ast::CompilationOptions comp_options;
  comp_options.flags |=
      slang::ast::CompilationFlags::LanguageServerMode |
      slang::ast::CompilationFlags::AllowHierarchicalConst |
      slang::ast::CompilationFlags::RelaxEnumConversions |
      slang::ast::CompilationFlags::AllowUseBeforeDeclare |
      slang::ast::CompilationFlags::RelaxStringConversions |
      slang::ast::CompilationFlags::AllowRecursiveImplicitCall |
      slang::ast::CompilationFlags::AllowBareValParamAssignment |
      slang::ast::CompilationFlags::AllowSelfDeterminedStreamConcat |
      slang::ast::CompilationFlags::AllowMergingAnsiPorts |
      slang::ast::CompilationFlags::AllowTopLevelIfacePorts |
      slang::ast::CompilationFlags::AllowUnnamedGenerate;
  comp_options.errorLimit = 0;
  options.set(comp_options);

  return options;
}

}  // namespace defnav::analysis
