#include "SimulationStage.h"
#include "BetTape.h"
#include "ExposureSimulator.h"
#include "TriggerEvaluator.h"

namespace theory_validator
{
  namespace pipeline
  {
    namespace stages
    {
      SimulationStage::SimulationStage(const concurrency::CancellationToken& token)
	: mToken(token)
      {}

      StageDecision SimulationStage::execute(AnalysisContext& ctx, std::ostream& os) const
      {
	const auto& target = ctx.request.target;

	if (auto reason = simulation::TriggerEvaluator::ineligibility(target))
	  {
	    os << "   [Simulation] Not run: " << *reason << "\n";
	    ctx.simulation = SimulationStatus::NotRun(*reason,
						      "Triggers need a probability: use a market target or a binary "
						      "stat target (home_win, away_win).");
	    return StageDecision::Stop(*reason);
	  }

	if (!ctx.model || !ctx.model->status.isComplete() || !ctx.model->model)
	  {
	    os << "   [Simulation] Not run: model_unavailable\n";
	    ctx.simulation = SimulationStatus::NotRun("model_unavailable",
						      "The scoring model could not be fitted; see modeling status.");
	    return StageDecision::Stop("model_unavailable");
	  }

	mToken.throwIfCancelled("trigger simulation");

	simulation::TriggerEvaluator trigger(ctx.request.trigger, target);
	std::vector<simulation::ScoredRow> scored;
	scored.reserve(ctx.dataset.rows.size());
	for (const auto& row : ctx.dataset.rows)
	  {
	    if (!row.target)
	      continue;
	    scored.push_back(trigger.evaluate(row, ctx.model->model->score(row)));
	  }

	SimulationOutput output;
	auto exposure = simulation::ExposureSimulator(ctx.request.exposure, target).select(scored);
	output.exposure = std::move(exposure.summary);
	output.tape = simulation::BetTapeBuilder(target, *ctx.computer).build(exposure.selected);
	output.slices = simulation::PerformanceSlicer::slice(output.tape, target);
	output.failures = simulation::PerformanceSlicer::failures(output.tape);

	os << "   [Simulation] " << scored.size() << " scored, " << output.exposure.triggered << " triggered, "
	   << output.exposure.selected << " selected, " << output.tape.size() << " settled\n";
	for (const auto& warning : output.exposure.warnings)
	  os << "   [Simulation] " << warning << "\n";

	ctx.simulation = SimulationStatus::Complete(std::move(output));
	return StageDecision::Continue();
      }
    }
  }
}
