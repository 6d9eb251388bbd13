#ifndef STARCAST_IO_JSON_WRITER_HPP
#define STARCAST_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../improvement_path.hpp"
#include "../model_fitting.hpp"
#include "../scenario.hpp"
#include "../simulation.hpp"
#include "../star_rating.hpp"

namespace starcast {
namespace io {

// Pieces of one analysis run; null members are omitted from the document
struct AnalysisDocument {
    std::string organization_id;
    int year;
    const RatingSnapshot* current;
    const FitReport* fit;
    const SimulationResult* simulation;
    const ImprovementPath* path;
    const StrategyReport* strategies;
    bool include_draws;                 // Emit per-draw ratings and measure draws

    AnalysisDocument();
};

// Write SimulationResult to JSON format
// The output includes statistics, the rating distribution, source tallies
// and optionally every draw
void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  bool include_draws = false, bool pretty_print = true);

// Write the full analysis result document
void write_analysis_json(std::ostream& os, const AnalysisDocument& doc,
                         bool pretty_print = true);

// Write the full analysis result document to a file
void write_analysis_json(const std::string& filepath, const AnalysisDocument& doc,
                         bool pretty_print = true);

} // namespace io
} // namespace starcast

#endif // STARCAST_IO_JSON_WRITER_HPP
