/**
 * @file graph_extractor.hpp
 */
#pragma once
#include "xdslc/common/common.hpp"
#include "xdslc/common/model_graph.hpp"
#include "xdslc/document/attributed_tree.hpp"

namespace xdslc
{

/**
 * @brief Walks an XDSL attributed tree once and fills a `ModelGraph`.
 *
 * @details
 * Recognized elements under `nodes`:
 * - `cpt` produces a chance node and, from `probabilities`, its table.
 * - `decision` produces a decision node.
 * - `utility` produces a utility node and, from `utilities`, its table.
 * - `mau` produces a `MauRecord` from `parents` and `weights`.
 *
 * States come from `state` children in declaration order. Parents come from
 * the whitespace-separated `parents` text; one `ArcRecord` is produced per
 * listed parent, and the node's own parent list keeps the first listing of
 * each parent. Table values are captured in document order; no reordering
 * happens here.
 *
 * Display names and positions are read from the GeNIe extension block.
 *
 * The extractor never rejects a document. Unknown element kinds, missing
 * ids, unparsable numbers and temporal constructs are recorded as issues on
 * the graph for the validator to report.
 */
class GraphExtractor
{
public:
    /**
     * @brief Extract the intermediate graph from a loaded document.
     * @param root The root element returned by `load_document()`.
     */
    ModelGraph extract(const XmlElement& root) const;

private:
    using DisplayMap = std::unordered_map<std::string, DisplayInfo>;

    void collect_display(const XmlElement& element, DisplayMap& display) const;

    void extract_node(const XmlElement& element, const DisplayMap& display,
                      ModelGraph& graph) const;

    void extract_mau(const XmlElement& element, const std::string& id,
                     ModelGraph& graph) const;

    void extract_dynamic(const XmlElement& element, ModelGraph& graph) const;

    /// Parse a whitespace-separated list of numbers, recording bad tokens.
    std::vector<double> parse_values(const XmlElement& element, const std::string& owner_id,
                                     ModelGraph& graph) const;
};

} // namespace xdslc
