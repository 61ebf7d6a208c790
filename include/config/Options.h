/***
 * Name: pyinfer::config::AnalyzerOptions
 * Purpose: Session-wide configuration: language flavor, analysis limits, host strictness, logging.
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace pyinfer::config {

    enum class LanguageVersion {
        V2,
        V3
    };

    // Cardinality caps for accumulated value sets; 0 leaves a set uncapped.
    // A union that would exceed its cap collapses to the top set and stays there.
    struct AnalysisLimits {
        std::size_t maxVariableTypes{0};       // --max-variable-types=<n>
        std::size_t maxReturnTypes{0};         // --max-return-types=<n>
        std::size_t maxInstanceMemberTypes{0}; // --max-member-types=<n>
    };

    struct LogOptions {
        bool modules{false};         // --log=modules
        bool units{false};           // --log=units
        bool specializations{false}; // --log=specializations
        bool host{true};             // --log=host (host contract breaches)
    };

#ifdef NDEBUG
    inline constexpr bool kStrictHostContractsDefault = false;
#else
    inline constexpr bool kStrictHostContractsDefault = true;
#endif

    struct AnalyzerOptions {
        LanguageVersion languageVersion{LanguageVersion::V3}; // --lang=2|3
        std::string builtinModuleName{};                      // --builtins=<name>; empty derives from version
        AnalysisLimits limits{};
        bool strictHostContracts{kStrictHostContractsDefault}; // --strict-host / --lenient-host
        std::string resourceLoaderModule{"wpf"};              // --resource-loader=<module>
        LogOptions log{};
    };

    // "builtins" for 3.x, "__builtin__" for 2.x, unless overridden.
    std::string builtinModuleNameFor(const AnalyzerOptions& opts);

    // Parse `--key=value` style settings into `out`. Returns false and sets `err` on the first
    // malformed or unknown setting; `out` keeps the settings applied before it.
    bool ParseOptions(const std::vector<std::string>& args, AnalyzerOptions& out, std::string& err);

} // namespace pyinfer::config
