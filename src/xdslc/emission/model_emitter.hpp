/**
 * @file model_emitter.hpp
 */
#pragma once
#include "xdslc/common/common.hpp"
#include "xdslc/common/model_graph.hpp"
#include "xdslc/emission/emission_plan.hpp"
#include "xdslc/emission/emit_sink.hpp"

namespace xdslc
{

/**
 * @brief Plans and replays the construction of a validated graph.
 *
 * @details
 * `plan()` orders the nodes, permutes every table into the target library
 * convention and applies MAU weights. `emit()` walks the plan and, for each
 * node in order, adds the node, declares one arc per parent and assigns the
 * table. Emission is append-only: no directive may reference a node that has
 * not yet been added.
 *
 * @par Thread safety
 * - Stateless apart from configuration; concurrent calls are safe.
 */
class ModelEmitter
{
public:
    /**
     * @param apply_utility_weights If true, utility tables are multiplied by
     *        the weight a MAU element assigns to them.
     */
    explicit ModelEmitter(bool apply_utility_weights = true);

    /**
     * @brief Compute the emission plan of a validated graph.
     * @throw ConversionError with `InvariantViolation` if the graph breaks a
     *        guarantee the validator is responsible for.
     */
    EmissionPlan plan(const ModelGraph& graph) const;

    /**
     * @brief Replay a plan into a sink.
     * @throw ConversionError with `InvariantViolation` if the plan does not
     *        cover the graph or would reference a node before adding it.
     */
    void emit(const ModelGraph& graph, const EmissionPlan& plan, IEmitSink& sink) const;

private:
    bool m_apply_utility_weights;
};

} // namespace xdslc
