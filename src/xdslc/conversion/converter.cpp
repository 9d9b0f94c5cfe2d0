/**
 * @file converter.cpp
 */
#include "xdslc/conversion/converter.hpp"
#include "xdslc/common/conversion_exceptions.hpp"
#include "xdslc/conversion/graph_extractor.hpp"
#include "xdslc/conversion/graph_validator.hpp"
#include "xdslc/document/document_loader.hpp"
#include "xdslc/emission/model_emitter.hpp"
#include "xdslc/emission/script_sink.hpp"

#include <sstream>

namespace xdslc
{

Converter::Converter(ConverterConfig config)
    : m_config{std::move(config)}
{}

ModelGraph Converter::parse(std::string_view document) const
{
    XmlElement root = load_document(document);
    return GraphExtractor{}.extract(root);
}

std::shared_ptr<ValidationReport> Converter::validate(const ModelGraph& graph) const
{
    auto report = GraphValidator{}.validate(graph);
    if (m_config.treat_warnings_as_errors)
    {
        report->promote_warnings();
    }
    return report;
}

EmissionPlan Converter::plan(const ModelGraph& graph) const
{
    return plan(graph, validate(graph));
}

EmissionPlan Converter::plan(const ModelGraph& graph,
                             const std::shared_ptr<ValidationReport>& report) const
{
    if (report->has_errors())
    {
        std::ostringstream oss;
        oss << "Validation failed with " << report->errors().size() << " error(s):\n";
        for (const auto& err : report->errors())
        {
            oss << "  - " << format_item(err) << "\n";
        }
        throw ValidationError(oss.str(), report);
    }

    return ModelEmitter{m_config.apply_utility_weights}.plan(graph);
}

void Converter::generate(const ModelGraph& graph, IEmitSink& sink) const
{
    EmissionPlan emission_plan = plan(graph);
    ModelEmitter{m_config.apply_utility_weights}.emit(graph, emission_plan, sink);
}

std::string Converter::generate_script(const ModelGraph& graph) const
{
    return generate_script(graph, plan(graph));
}

std::string Converter::generate_script(const ModelGraph& graph,
                                       const EmissionPlan& emission_plan) const
{
    ScriptOptions options;
    options.diagram_variable = m_config.diagram_variable;
    options.emit_comments = m_config.emit_comments;

    ScriptSink sink{options};
    ModelEmitter{m_config.apply_utility_weights}.emit(graph, emission_plan, sink);
    return sink.str();
}

std::shared_ptr<InfluenceDiagram> Converter::generate_model(const ModelGraph& graph) const
{
    return generate_model(graph, plan(graph));
}

std::shared_ptr<InfluenceDiagram> Converter::generate_model(
    const ModelGraph& graph, const EmissionPlan& emission_plan) const
{
    InfluenceDiagramSink sink;
    ModelEmitter{m_config.apply_utility_weights}.emit(graph, emission_plan, sink);
    return sink.diagram();
}

std::string convert_to_script(std::string_view document, ConverterConfig config)
{
    Converter converter{std::move(config)};
    return converter.generate_script(converter.parse(document));
}

std::shared_ptr<InfluenceDiagram> convert_to_model(std::string_view document,
                                                   ConverterConfig config)
{
    Converter converter{std::move(config)};
    return converter.generate_model(converter.parse(document));
}

} // namespace xdslc
