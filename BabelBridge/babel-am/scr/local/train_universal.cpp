/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "babel-am/scr/babel_scr.h"
#include "babel-am/scr/Pipeline.h"

namespace BabelBridge {

	static TrainStep MakeStep(const std::string & name, fs::path data, AlignKind align, const std::string & align_src,
		const std::string & align_dir, int align_nj, TrainKind train, int num_leaves, int num_gauss, int train_nj, bool reestimate)
	{
		TrainStep s;
		s.name = name;
		s.data = data;
		s.align = align;
		s.align_src = align_src;
		s.align_dir = align_dir;
		s.align_nj = align_nj;
		s.train = train;
		s.num_leaves = num_leaves;
		s.num_gauss = num_gauss;
		s.train_nj = train_nj;
		s.reestimate = reestimate;
		return s;
	}

	/*
		mono -> tri1 -> tri2 on the subsets with the base lang directory, then tri3 (deltas), tri4 (LDA+MLLT),
		tri5 (SAT) and the fMLLR alignment on the whole corpus. From tri2 on every step re-estimates the
		pronunciation probabilities and the next step uses the lang directory of the previous one.
	*/
	std::vector<TrainStep> UniversalTrainingChain(const Params & p)
	{
		std::vector<TrainStep> chain;
		chain.push_back(MakeStep("mono", p.SubsetDir(1), AlignKind::None, "", "", 0,
			TrainKind::Mono, 0, 0, p.mono_nj, false));
		chain.push_back(MakeStep("tri1", p.SubsetDir(2), AlignKind::Si, "mono", "mono_ali_sub2", p.sub2_ali_nj,
			TrainKind::Deltas, p.num_leaves_tri1, p.num_gauss_tri1, 0, false));
		chain.push_back(MakeStep("tri2", p.SubsetDir(3), AlignKind::Si, "tri1", "tri1_ali_sub3", p.sub3_ali_nj,
			TrainKind::Deltas, p.num_leaves_tri2, p.num_gauss_tri2, 0, true));
		chain.push_back(MakeStep("tri3", p.pth_train, AlignKind::Si, "tri2", "tri2_ali", p.train_nj,
			TrainKind::Deltas, p.num_leaves_tri3, p.num_gauss_tri3, 0, true));
		chain.push_back(MakeStep("tri4", p.pth_train, AlignKind::Si, "tri3", "tri3_ali", p.train_nj,
			TrainKind::LdaMllt, p.num_leaves_mllt, p.num_gauss_mllt, 0, true));
		chain.push_back(MakeStep("tri5", p.pth_train, AlignKind::Si, "tri4", "tri4_ali", p.train_nj,
			TrainKind::Sat, p.num_leaves_sat, p.num_gauss_sat, 0, true));
		chain.push_back(MakeStep("tri5_ali", p.pth_train, AlignKind::Fmllr, "tri5", "tri5_ali", p.train_nj,
			TrainKind::None, 0, 0, 0, true));
		return chain;
	}

	fs::path ReestimatedLang(const Params & params, const std::string & step)
	{
		return params.pth_lang_universalp / step;
	}

	//data/train_sub1..3; the marker of the last subset stands for all three
	int CreateTrainingSubsets(const PipelineContext & ctx)
	{
		const Params & params = ctx.params;
		return RunGatedStep(ctx, params.SubsetDir(3), "subsets", [&]() -> int {
			LOGTW_INFO << "---------------------------------------------------------------------";
			LOGTW_INFO << "Subsetting monophone training data in data/train_sub[123]";
			LOGTW_INFO << "---------------------------------------------------------------------";
			int ret = RequireInputs("subsets", { params.pth_train / "utt2spk" });
			if (ret < 0) return ret;
			for (size_t i = 0; i < params.subset_sizes.size(); i++) {
				ret = SubsetDataDir(params.pth_train, params.subset_sizes[i], params.SubsetDir((int)i + 1));
				if (ret < 0) return ret;
			}
			return BB_OK;
		});
	}

	static int RunTrainStep(const PipelineContext & ctx, const TrainStep & step, const fs::path & lang)
	{
		const Params & params = ctx.params;
		fs::path dir(params.pth_exp / step.name);
		int ret = BB_OK;

		LOGTW_INFO << "---------------------------------------------------------------------";
		LOGTW_INFO << "Starting " << step.name << " in " << Rel(params, dir) << " (lang: " << Rel(params, lang) << ")";
		LOGTW_INFO << "---------------------------------------------------------------------";

		fs::path alidir;
		if (step.align != AlignKind::None) {
			alidir = params.pth_exp / step.align_dir;
			fs::path srcdir(params.pth_exp / step.align_src);
			if (step.align == AlignKind::Si)
				ret = AlignSi(ctx, step.align_nj, step.data, lang, srcdir, alidir);
			else
				ret = AlignFmllr(ctx, step.align_nj, step.data, lang, srcdir, alidir);
			if (ret < 0) return ret;
		}

		switch (step.train) {
		case TrainKind::Mono:
			ret = TrainMono(ctx, step.train_nj, step.data, lang, dir);
			break;
		case TrainKind::Deltas:
			ret = TrainDeltas(ctx, step.num_leaves, step.num_gauss, step.data, lang, alidir, dir);
			break;
		case TrainKind::LdaMllt:
			ret = TrainLdaMllt(ctx, step.num_leaves, step.num_gauss, step.data, lang, alidir, dir);
			break;
		case TrainKind::Sat:
			ret = TrainSat(ctx, step.num_leaves, step.num_gauss, step.data, lang, alidir, dir);
			break;
		case TrainKind::None:
			break;
		}
		if (ret < 0) return ret;

		if (step.reestimate) {
			ret = ReestimateLangp(ctx, step.data, params.pth_lang_universal, params.pth_dict_universal, dir,
				params.pth_dict_universal / "dictp" / step.name,
				params.pth_dict_universal / "langp" / step.name,
				ReestimatedLang(params, step.name));
			if (ret < 0) return ret;
		}
		return BB_OK;
	}

	/*
		Runs the steps in order; a step with a completion marker is skipped. The lang directory of a step is the
		base lang directory or the one re-estimated by the closest previous re-estimating step, whether that step
		ran now or in an earlier run.
	*/
	int RunTrainingChain(const PipelineContext & ctx, const std::vector<TrainStep> & chain)
	{
		const Params & params = ctx.params;
		fs::path lang(params.pth_lang_universal);
		for (const TrainStep & step : chain) {
			int ret = RunGatedStep(ctx, params.pth_exp / step.name, step.name, [&]() -> int {
				return RunTrainStep(ctx, step, lang);
			});
			if (ret < 0) {
				LOGTW_ERROR << "Training step " << step.name << " failed.";
				return ret;
			}
			if (step.reestimate) lang = ReestimatedLang(params, step.name);
		}
		return BB_OK;
	}
}
