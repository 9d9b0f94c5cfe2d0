/**
 * @file converter.hpp
 * @brief Converter pipeline and ConverterConfig.
 */
#pragma once
#include "xdslc/common/common.hpp"
#include "xdslc/common/model_graph.hpp"
#include "xdslc/common/validation_report.hpp"
#include "xdslc/emission/emission_plan.hpp"
#include "xdslc/emission/emit_sink.hpp"
#include "xdslc/emission/influence_diagram.hpp"

namespace xdslc
{

/**
 * @brief Configuration for converter behavior.
 */
struct ConverterConfig
{
    /**
     * @brief Whether MAU weights scale the utility tables they name.
     */
    bool apply_utility_weights{true};

    /**
     * @brief Whether warnings block emission like errors do.
     */
    bool treat_warnings_as_errors{false};

    /**
     * @brief Whether the script carries explanatory comments.
     */
    bool emit_comments{true};

    /**
     * @brief Name of the script variable holding the influence diagram.
     */
    std::string diagram_variable{"diag"};
};

/**
 * @brief Converts XDSL documents into construction scripts or models.
 *
 * @details
 * The pipeline is: `load_document()` -> `GraphExtractor` -> `GraphValidator`
 * (gate) -> `TopologicalOrderer` -> `TableReindexer` -> `ModelEmitter` ->
 * sink. The converter holds configuration only; every call works on a
 * caller-owned `ModelGraph`, so one converter may serve concurrent callers.
 *
 * @par Usage
 * 1. `parse()` the document text into a graph.
 * 2. Optionally `validate()` it to inspect every problem.
 * 3. `generate_script()` or `generate_model()`; both validate first and
 *    throw `ValidationError` with the full report if the graph has errors.
 *
 * @par Thread Safety
 * - All methods are const; concurrent calls are safe.
 */
class Converter
{
public:
    explicit Converter(ConverterConfig config = {});

    /**
     * @brief Load and extract a document.
     * @throw ConversionError with `MalformedDocument` if the text is not
     *        well-formed markup.
     */
    ModelGraph parse(std::string_view document) const;

    /**
     * @brief Validate a graph, honoring `treat_warnings_as_errors`.
     */
    std::shared_ptr<ValidationReport> validate(const ModelGraph& graph) const;

    /**
     * @brief Validate a graph and compute its emission plan.
     * @throw ValidationError if the graph has validation errors.
     */
    EmissionPlan plan(const ModelGraph& graph) const;

    /**
     * @brief Compute the emission plan of a graph already validated.
     * @param report The result of `validate(graph)`.
     * @throw ValidationError if the report has errors.
     */
    EmissionPlan plan(const ModelGraph& graph,
                      const std::shared_ptr<ValidationReport>& report) const;

    /**
     * @brief Replay a validated graph into any sink.
     * @throw ValidationError if the graph has validation errors.
     */
    void generate(const ModelGraph& graph, IEmitSink& sink) const;

    /**
     * @brief Produce the textual construction script.
     * @throw ValidationError if the graph has validation errors.
     */
    std::string generate_script(const ModelGraph& graph) const;
    std::string generate_script(const ModelGraph& graph, const EmissionPlan& plan) const;

    /**
     * @brief Produce the populated in-memory model.
     * @throw ValidationError if the graph has validation errors.
     */
    std::shared_ptr<InfluenceDiagram> generate_model(const ModelGraph& graph) const;
    std::shared_ptr<InfluenceDiagram> generate_model(const ModelGraph& graph,
                                                     const EmissionPlan& plan) const;

    const ConverterConfig& config() const noexcept
    {
        return m_config;
    }

private:
    ConverterConfig m_config;
};

/**
 * @brief Convert a document to a script in one call.
 */
std::string convert_to_script(std::string_view document, ConverterConfig config = {});

/**
 * @brief Convert a document to an in-memory model in one call.
 */
std::shared_ptr<InfluenceDiagram> convert_to_model(std::string_view document,
                                                   ConverterConfig config = {});

} // namespace xdslc
