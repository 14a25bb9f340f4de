/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "babel-am/scr/Pipeline.h"
#include "babel-am/scr/Status.h"

namespace BabelBridge {

	int RunCleanupSegmentation(const PipelineContext & ctx)
	{
		const Params & params = ctx.params;
		fs::path lang(ReestimatedLang(params, "tri5"));
		int ret = RequireInputs("cleanup", { lang, params.pth_exp / "tri5" });
		if (ret < 0) return ret;
		return ctx.executor.Run(MakeCommand(params, "cleanup_segmentation", params.cleanup_script,
			{ "--langdir", Rel(params, lang) }));
	}

	int RunChainTraining(const PipelineContext & ctx)
	{
		const Params & params = ctx.params;
		fs::path lang(ReestimatedLang(params, "tri5_ali"));
		int ret = RequireInputs("chain", { lang, params.pth_exp / "tri5_ali" });
		if (ret < 0) return ret;
		return ctx.executor.Run(MakeCommand(params, "chain", params.chain_script,
			{ "--langdir", Rel(params, lang), "--stage", std::to_string(params.chain_stage) }));
	}

	//NOTE: the stage bodies run after this function returned; 'ctx' must outlive the runner
	void AddUniversalStages(StageRunner & runner, const PipelineContext & ctx)
	{
		const PipelineContext * pctx = &ctx;
		auto forEachItem = [pctx](int(*step)(const PipelineContext &, const std::string &)) -> int {
			return RunForEachItem(pctx->params.langs, pctx->params.num_workers, [pctx, step](const std::string & item) {
				return step(*pctx, item);
			});
		};

		runner.AddStage(0, "set up item workspaces", [forEachItem]() { return forEachItem(SetupItemWorkspace); });
		runner.AddStage(1, "prepare item data", [forEachItem]() { return forEachItem(PrepareItemData); });
		runner.AddStage(2, "prepare item lexicons", [forEachItem]() { return forEachItem(PrepareItemLexicon); });
		runner.AddStage(3, "prefix item data", [forEachItem]() { return forEachItem(PrefixItemData); });
		runner.AddStage(4, "combine data and lexicons, create the universal lang", [pctx]() {
			int ret = CombineItemData(*pctx);
			if (ret > -1) ret = CombineItemLexicons(*pctx);
			if (ret > -1) ret = PrepareUniversalLang(*pctx);
			return ret;
		});
		runner.AddStage(5, "training through tri5", [pctx]() {
			const Params & params = pctx->params;
			int ret = RequireInputs("training", { params.pth_train / "utt2spk", params.pth_lang_universal });
			if (ret > -1) ret = CreateTrainingSubsets(*pctx);
			if (ret > -1) ret = RunTrainingChain(*pctx, UniversalTrainingChain(params));
			return ret;
		});
		runner.AddStage(6, "cleanup data and segmentation", [pctx]() { return RunCleanupSegmentation(*pctx); });
		runner.AddStage(7, "chain model training", [pctx]() { return RunChainTraining(*pctx); });
	}
}
