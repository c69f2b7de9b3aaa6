#include "ModelingStage.h"
#include <set>

namespace theory_validator
{
  namespace pipeline
  {
    namespace stages
    {
      namespace
      {
	std::vector<std::size_t> candidateColumns(const AnalysisContext& ctx)
	{
	  if (ctx.model->model)
	    return ctx.model->model->scaler().columns();

	  std::set<std::string> dropped;
	  for (const auto& d : ctx.model->dropped)
	    {
	      if (d.reason != "model_fit_failed")
		dropped.insert(d.feature);
	    }
	  std::vector<std::size_t> columns;
	  for (std::size_t c = 0; c < ctx.dataset.columns.size(); ++c)
	    {
	      if (dropped.count(ctx.dataset.columns[c].name) == 0)
		columns.push_back(c);
	    }
	  return columns;
	}
      }

      ModelingStage::ModelingStage(const modeling::ModelPolicy& policy)
	: mBuilder(policy),
	  mCandidates(policy.candidates)
      {}

      StageDecision ModelingStage::execute(AnalysisContext& ctx, std::ostream& os) const
      {
	ctx.model = mBuilder.build(ctx.dataset, ctx.request.target, os);

	ctx.theoryCandidates = mCandidates.generate(ctx.dataset.columns, candidateColumns(ctx),
						    ctx.rowPointers(), ctx.request.target);
	if (ctx.model->status.isComplete())
	  ctx.suggestedTheories = modeling::TheoryCandidateGenerator::suggest(ctx.correlations,
									       ctx.theoryCandidates);
	os << "   [Model] " << ctx.theoryCandidates.size() << " theory candidates" << std::endl;

	if (!ctx.model->status.isComplete())
	  return StageDecision::Stop(ctx.model->status.reason());

	return StageDecision::Continue();
      }
    }
  }
}
