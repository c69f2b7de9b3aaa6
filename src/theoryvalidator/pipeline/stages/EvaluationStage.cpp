#include "EvaluationStage.h"
#include <iomanip>
#include "Evaluator.h"
#include "FeatureDiagnostics.h"

namespace theory_validator
{
  namespace pipeline
  {
    namespace stages
    {
      EvaluationStage::EvaluationStage(const evaluation::VerdictPolicy& policy)
	: mPolicy(policy)
      {}

      StageDecision EvaluationStage::execute(AnalysisContext& ctx, std::ostream& os) const
      {
	evaluation::Evaluator evaluator(mPolicy);
	ctx.evaluation = evaluator.evaluate(ctx.request.target, ctx.selection.baseline, ctx.dataset.rows);
	ctx.correlations = evaluation::FeatureDiagnostics::correlations(ctx.dataset);
	ctx.featureQuality = evaluation::FeatureDiagnostics::quality(ctx.dataset);
	ctx.insights = evaluation::FeatureDiagnostics::insights(ctx.evaluation, ctx.correlations);

	if (!ctx.evaluation.available())
	  {
	    os << "✗ Evaluation unavailable: " << *ctx.evaluation.reasonCode << "\n";
	    return StageDecision::Continue(*ctx.evaluation.reasonCode);
	  }

	os << "   [Evaluate] " << ctx.evaluation.targetName << " n=" << ctx.evaluation.sampleSize;
	if (ctx.evaluation.delta)
	  os << std::fixed << std::setprecision(4) << " delta=" << *ctx.evaluation.delta;
	os << " (" << ctx.evaluation.liftLabel << ", " << ctx.evaluation.sampleLabel << ")\n";

	return StageDecision::Continue();
      }
    }
  }
}
