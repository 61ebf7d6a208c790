/***
 * Name: pyinfer::config::ParseOptions
 * Purpose: Apply `--key=value` settings supplied by the embedding host to AnalyzerOptions.
 * Inputs:
 *   - args: settings such as "--lang=2", "--max-variable-types=64", "--log=units,modules"
 * Outputs:
 *   - out: updated options
 *   - err: message naming the offending setting on failure
 */
#include "config/Options.h"

#include <string_view>

#include "pyinfer/support/parse.h"

namespace pyinfer::config {

namespace {

bool startsWith(std::string_view arg, std::string_view prefix) { return arg.rfind(prefix, 0) == 0; }

bool applyCount(std::string_view arg, std::string_view prefix, std::size_t& slot, std::string& err) {
    std::size_t value = 0;
    std::string why;
    if (!support::ParseCountStrict(arg.substr(prefix.size()), value, &why)) {
        err = "invalid value for " + std::string(prefix) + " " + why;
        return false;
    }
    slot = value;
    return true;
}

bool applyLogList(std::string_view list, LogOptions& log, std::string& err) {
    log = LogOptions{false, false, false, false};
    for (const auto& item : support::SplitList(list, ',')) {
        if (item == "modules") { log.modules = true; }
        else if (item == "units") { log.units = true; }
        else if (item == "specializations") { log.specializations = true; }
        else if (item == "host") { log.host = true; }
        else if (item == "all") { log = LogOptions{true, true, true, true}; }
        else {
            err = "unknown log category '" + item + "'";
            return false;
        }
    }
    return true;
}

bool applyOne(std::string_view arg, AnalyzerOptions& out, std::string& err) {
    if (constexpr std::string_view langPrefix{"--lang="}; startsWith(arg, langPrefix)) {
        const std::string_view value = arg.substr(langPrefix.size());
        if (value == "2") { out.languageVersion = LanguageVersion::V2; return true; }
        if (value == "3") { out.languageVersion = LanguageVersion::V3; return true; }
        err = "invalid value for --lang= expected 2 or 3";
        return false;
    }
    if (constexpr std::string_view builtinsPrefix{"--builtins="}; startsWith(arg, builtinsPrefix)) {
        out.builtinModuleName = std::string(arg.substr(builtinsPrefix.size()));
        return true;
    }
    if (constexpr std::string_view varPrefix{"--max-variable-types="}; startsWith(arg, varPrefix)) {
        return applyCount(arg, varPrefix, out.limits.maxVariableTypes, err);
    }
    if (constexpr std::string_view retPrefix{"--max-return-types="}; startsWith(arg, retPrefix)) {
        return applyCount(arg, retPrefix, out.limits.maxReturnTypes, err);
    }
    if (constexpr std::string_view memberPrefix{"--max-member-types="}; startsWith(arg, memberPrefix)) {
        return applyCount(arg, memberPrefix, out.limits.maxInstanceMemberTypes, err);
    }
    if (constexpr std::string_view loaderPrefix{"--resource-loader="}; startsWith(arg, loaderPrefix)) {
        out.resourceLoaderModule = std::string(arg.substr(loaderPrefix.size()));
        return true;
    }
    if (constexpr std::string_view logPrefix{"--log="}; startsWith(arg, logPrefix)) {
        return applyLogList(arg.substr(logPrefix.size()), out.log, err);
    }
    if (arg == "--strict-host") { out.strictHostContracts = true; return true; }
    if (arg == "--lenient-host") { out.strictHostContracts = false; return true; }
    err = "unknown option '" + std::string(arg) + "'";
    return false;
}

} // namespace

bool ParseOptions(const std::vector<std::string>& args, AnalyzerOptions& out, std::string& err) {
    for (const auto& arg : args) {
        if (!applyOne(arg, out, err)) {
            return false;
        }
    }
    return true;
}

std::string builtinModuleNameFor(const AnalyzerOptions& opts) {
    if (!opts.builtinModuleName.empty()) {
        return opts.builtinModuleName;
    }
    return opts.languageVersion == LanguageVersion::V3 ? "builtins" : "__builtin__";
}

} // namespace pyinfer::config
