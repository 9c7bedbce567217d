#include "TextPipeline.hpp"
#include "Diagnostics.hpp"
#include "FormatEscaper.hpp"
#include "FrenchFormatter.hpp"
#include "PunctuationCleaner.hpp"
#include "QuoteClassifier.hpp"
#include "SmallCaps.hpp"
#include "StageRunner.hpp"
#include "TextNormalizer.hpp"
#include "../utils/Profile.hpp"

#include <sstream>

#include <plog/Log.h>

namespace typokit
{

namespace
{

void logInput(const std::string& input)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance) << "[TextPipeline] stage=input raw=" << Diagnostics::Preview(input);
}

void logStageResult(const StageResult<std::string>& stage, const std::string& input)
{
    if (!Diagnostics::IsVerbose())
        return;

    std::ostringstream oss;
    oss << "[TextPipeline] stage=" << stage.stage_name;
    if (stage.succeeded)
    {
        oss << " status=ok duration=" << stage.duration.count() << "us"
            << " input=" << Diagnostics::Preview(input) << " output=" << Diagnostics::Preview(stage.result);
        PLOG_INFO_(Diagnostics::kLogInstance) << oss.str();
    }
    else
    {
        oss << " status=error duration=" << stage.duration.count() << "us"
            << " input=" << Diagnostics::Preview(input) << " reason=" << stage.error.value_or("unknown");
        PLOG_ERROR_(Diagnostics::kLogInstance) << oss.str();
    }
}

void logCompletion(const std::string& output)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance) << "[TextPipeline] stage=complete output=" << Diagnostics::Preview(output);
}

} // anonymous namespace

const std::vector<TransformationInfo>& transformation_catalog()
{
    static const std::vector<TransformationInfo> catalog = {
        { Transformation::CleanWhitespaces, "clean_whitespaces", "collapse runs of whitespace into one space" },
        { Transformation::CleanEllipsis, "clean_ellipsis", "replace '...' with the ellipsis character" },
        { Transformation::CleanQuotes, "clean_quotes", "try to replace straight quotes with curly ones" },
        { Transformation::CleanDashes, "clean_dashes", "replace '--' and '---' with en and em dashes" },
        { Transformation::CleanGuillemets, "clean_guillemets", "replace '<<' and '>>' with guillemets" },
        { Transformation::FormatFrench, "format_french", "try to apply french typographic rules" },
        { Transformation::FormatFrenchTex, "format_french_tex", "apply french rules, writing spaces as LaTeX commands" },
        { Transformation::FormatFrenchHtml, "format_french_html", "apply french rules, writing spaces as HTML entities" },
        { Transformation::EscapeHtml, "escape_html", "escape text for HTML display" },
        { Transformation::EscapeTex, "escape_tex", "escape text for LaTeX display" },
        { Transformation::EscapeNbSpaces, "escape_nb_spaces", "escape non-breaking spaces using HTML entities" },
        { Transformation::EscapeNbSpacesTex, "escape_nb_spaces_tex", "escape non-breaking spaces using LaTeX commands" },
        { Transformation::EscapeQuotes, "escape_quotes", "replace double quotes with single ones" },
        { Transformation::CapsLatex, "caps_latex", "set upper-case words in LaTeX small caps" },
    };
    return catalog;
}

std::optional<Transformation> parse_transformation(std::string_view name)
{
    for (const auto& info : transformation_catalog())
    {
        if (info.name == name)
            return info.id;
    }
    return std::nullopt;
}

std::string_view transformation_name(Transformation t)
{
    for (const auto& info : transformation_catalog())
    {
        if (info.id == t)
            return info.name;
    }
    return "unknown";
}

std::string apply_transformation(Transformation t, const std::string& text, const TypographyConfig& config)
{
    switch (t)
    {
    case Transformation::CleanWhitespaces:
        return normalize_whitespace(text);
    case Transformation::CleanEllipsis:
        return clean_ellipsis(text);
    case Transformation::CleanQuotes:
        return classify_quotes(text, config);
    case Transformation::CleanDashes:
        return clean_dashes(text);
    case Transformation::CleanGuillemets:
        return clean_guillemets(text);
    case Transformation::FormatFrench:
        return format_french(text, config);
    case Transformation::FormatFrenchTex:
        return format_french_markup(text, config, tex_space_escaper());
    case Transformation::FormatFrenchHtml:
        return format_french_markup(text, config, html_space_escaper());
    case Transformation::EscapeHtml:
        return escape_html(text);
    case Transformation::EscapeTex:
        return escape_tex(text);
    case Transformation::EscapeNbSpaces:
        return escape_nb_spaces_html(text);
    case Transformation::EscapeNbSpacesTex:
        return escape_nb_spaces_tex(text);
    case Transformation::EscapeQuotes:
        return escape_quotes(text);
    case Transformation::CapsLatex:
        return caps_latex(text);
    }
    return text;
}

struct TextPipeline::Impl
{
    Impl(TypographyConfig cfg, std::vector<Transformation> s)
        : config(cfg)
        , steps(std::move(s))
    {
    }

    TypographyConfig config;
    std::vector<Transformation> steps;
};

TextPipeline::TextPipeline(TypographyConfig config, std::vector<Transformation> steps)
    : impl_(std::make_unique<Impl>(config, std::move(steps)))
{
}

TextPipeline::~TextPipeline() = default;

const TypographyConfig& TextPipeline::config() const noexcept { return impl_->config; }

const std::vector<Transformation>& TextPipeline::steps() const noexcept { return impl_->steps; }

StageResult<std::string> TextPipeline::process(const std::string& input) const
{
    TYPOKIT_PROFILE_ZONE("TextPipeline::process");

    logInput(input);

    std::chrono::microseconds total{ 0 };
    std::string current = input;
    for (Transformation step : impl_->steps)
    {
        auto stage = run_stage<std::string>(std::string(transformation_name(step)),
                                            [&]()
                                            {
                                                return apply_transformation(step, current, impl_->config);
                                            });
        logStageResult(stage, current);
        total += stage.duration;
        if (!stage.succeeded)
            return StageResult<std::string>::failure(stage.error.value_or("unknown error"), total, stage.stage_name);
        current = std::move(stage.result);
    }

    logCompletion(current);
    return StageResult<std::string>::success(std::move(current), total, "pipeline");
}

} // namespace typokit
