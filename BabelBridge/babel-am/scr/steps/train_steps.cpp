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

	static std::string FormatBoost(double d)
	{
		std::ostringstream s;
		s << d;
		return s.str();
	}

	//common part of the triphone trainers: <script> --boost-silence B --cmd CMD <leaves> <gauss> <data> <lang> <alidir> <dir>
	static int TrainTriphones(const PipelineContext & ctx, const std::string & script, int numleaves, int totgauss,
		fs::path data, fs::path lang, fs::path alidir, fs::path dir)
	{
		const Params & params = ctx.params;
		std::string label(dir.filename().string() + "." + fs::path(script).stem().string());
		int ret = RequireInputs(label, { data, lang, alidir });
		if (ret < 0) return ret;
		if (numleaves < 1 || totgauss < numleaves) {
			LOGTW_ERROR << "[" << label << "] Invalid number of leaves (" << numleaves << ") or gaussians (" << totgauss << ").";
			return BB_CONFIGURATION_ERROR;
		}
		ToolkitCommand cmd = MakeCommand(params, label, script, {
			"--boost-silence", FormatBoost(params.boost_sil),
			"--cmd", params.train_cmd,
			std::to_string(numleaves), std::to_string(totgauss),
			Rel(params, data), Rel(params, lang), Rel(params, alidir), Rel(params, dir) });
		return ctx.executor.Run(cmd);
	}

	int TrainMono(const PipelineContext & ctx, int nj, fs::path data, fs::path lang, fs::path dir)
	{
		const Params & params = ctx.params;
		std::string label(dir.filename().string() + ".train_mono");
		int ret = RequireInputs(label, { data, lang });
		if (ret < 0) return ret;
		ToolkitCommand cmd = MakeCommand(params, label, "steps/train_mono.sh", {
			"--boost-silence", FormatBoost(params.boost_sil),
			"--nj", std::to_string(nj),
			"--cmd", params.train_cmd,
			Rel(params, data), Rel(params, lang), Rel(params, dir) });
		return ctx.executor.Run(cmd);
	}

	int TrainDeltas(const PipelineContext & ctx, int numleaves, int totgauss, fs::path data, fs::path lang, fs::path alidir, fs::path dir)
	{
		return TrainTriphones(ctx, "steps/train_deltas.sh", numleaves, totgauss, data, lang, alidir, dir);
	}

	int TrainLdaMllt(const PipelineContext & ctx, int numleaves, int totgauss, fs::path data, fs::path lang, fs::path alidir, fs::path dir)
	{
		return TrainTriphones(ctx, "steps/train_lda_mllt.sh", numleaves, totgauss, data, lang, alidir, dir);
	}

	int TrainSat(const PipelineContext & ctx, int numleaves, int totgauss, fs::path data, fs::path lang, fs::path alidir, fs::path dir)
	{
		return TrainTriphones(ctx, "steps/train_sat.sh", numleaves, totgauss, data, lang, alidir, dir);
	}

	static int Align(const PipelineContext & ctx, const std::string & script, int nj, fs::path data, fs::path lang, fs::path srcdir, fs::path dir)
	{
		const Params & params = ctx.params;
		std::string label(dir.filename().string() + "." + fs::path(script).stem().string());
		int ret = RequireInputs(label, { data, lang, srcdir });
		if (ret < 0) return ret;
		ToolkitCommand cmd = MakeCommand(params, label, script, {
			"--boost-silence", FormatBoost(params.boost_sil),
			"--nj", std::to_string(nj),
			"--cmd", params.train_cmd,
			Rel(params, data), Rel(params, lang), Rel(params, srcdir), Rel(params, dir) });
		return ctx.executor.Run(cmd);
	}

	int AlignSi(const PipelineContext & ctx, int nj, fs::path data, fs::path lang, fs::path srcdir, fs::path dir)
	{
		return Align(ctx, "steps/align_si.sh", nj, data, lang, srcdir, dir);
	}

	int AlignFmllr(const PipelineContext & ctx, int nj, fs::path data, fs::path lang, fs::path srcdir, fs::path dir)
	{
		return Align(ctx, "steps/align_fmllr.sh", nj, data, lang, srcdir, dir);
	}

	/*
		utils/prepare_lang.sh --share-silence-phones true <dict> <oov> <tmpdir> <lang>
		or, with a phone symbol table (the phones of a re-estimated lang must keep their ids):
		utils/prepare_lang.sh --phone-symbol-table <table> <dict> <oov> <tmpdir> <lang>
	*/
	int PrepareLang(const PipelineContext & ctx, const std::string & label, fs::path dict, fs::path tmpdir, fs::path lang, fs::path phone_symbol_table)
	{
		const Params & params = ctx.params;
		std::vector<fs::path> inputs = { dict };
		if (!phone_symbol_table.empty()) inputs.push_back(phone_symbol_table);
		int ret = RequireInputs(label, inputs);
		if (ret < 0) return ret;
		string_vec args;
		if (phone_symbol_table.empty()) {
			args.push_back("--share-silence-phones");
			args.push_back("true");
		}
		else {
			args.push_back("--phone-symbol-table");
			args.push_back(Rel(params, phone_symbol_table));
		}
		args.push_back(Rel(params, dict));
		args.push_back(params.oov_symbol);
		args.push_back(Rel(params, tmpdir));
		args.push_back(Rel(params, lang));
		return ctx.executor.Run(MakeCommand(params, label, "utils/prepare_lang.sh", args));
	}
}
