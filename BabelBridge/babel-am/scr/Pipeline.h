/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/
#pragma once

#include <babel-am/stdafx.h>
#include "babel-am/scr/Params.h"
#include "babel-am/scr/StateStore.h"
#include "babel-am/scr/StepExecutor.h"
#include "babel-am/scr/StageRunner.h"

namespace BabelBridge {

	//everything a pipeline step needs; the parameters are read-only
	struct BABELBRIDGE_API PipelineContext
	{
		PipelineContext(const Params & p, StateStore & s, StepExecutor & e) : params(p), state(s), executor(e) {}

		const Params & params;
		StateStore & state;
		StepExecutor & executor;
	};

	using ItemTask = std::function<int(const std::string & item)>;

	/*
		Runs 'task' for each item on at most 'num_workers' threads. After the first failure no new item is
		started; the items already running are finished and all threads are joined before returning.
		Returns BB_OK or the status of the first failed item (in item order).
	*/
	BABELBRIDGE_API int RunForEachItem(const string_vec & items, int num_workers, ItemTask task);

	//runs 'body' unless the step with output 'outdir' is complete and marks the step complete after success
	BABELBRIDGE_API int RunGatedStep(const PipelineContext & ctx, const fs::path & outdir, const std::string & label, std::function<int()> body);

	//BB_STATE_ERROR if one of the upstream artifacts is missing
	BABELBRIDGE_API int RequireInputs(const std::string & label, const std::vector<fs::path> & inputs);

	//a toolkit command running in the project directory with its log in exp/log/<label>.log
	BABELBRIDGE_API ToolkitCommand MakeCommand(const Params & params, const std::string & label, const std::string & script, const string_vec & args);
	//project relative path as passed to the toolkit scripts
	BABELBRIDGE_API std::string Rel(const Params & params, const fs::path & p);

	//---------------------------------------------------------------------------------------------------
	// per item steps (stages 0..3)
	//---------------------------------------------------------------------------------------------------
	BABELBRIDGE_API int SetupItemWorkspace(const PipelineContext & ctx, const std::string & item);
	BABELBRIDGE_API int PrepareItemData(const PipelineContext & ctx, const std::string & item);
	BABELBRIDGE_API int PrepareItemLexicon(const PipelineContext & ctx, const std::string & item);
	BABELBRIDGE_API int PrefixItemData(const PipelineContext & ctx, const std::string & item);

	//---------------------------------------------------------------------------------------------------
	// merging (stage 4)
	//---------------------------------------------------------------------------------------------------
	BABELBRIDGE_API int CombineItemData(const PipelineContext & ctx);
	BABELBRIDGE_API int CombineItemLexicons(const PipelineContext & ctx);
	BABELBRIDGE_API int PrepareUniversalLang(const PipelineContext & ctx);

	//---------------------------------------------------------------------------------------------------
	// toolkit training and alignment steps
	//---------------------------------------------------------------------------------------------------
	BABELBRIDGE_API int PrepareLang(const PipelineContext & ctx, const std::string & label, fs::path dict, fs::path tmpdir, fs::path lang, fs::path phone_symbol_table = fs::path());
	BABELBRIDGE_API int TrainMono(const PipelineContext & ctx, int nj, fs::path data, fs::path lang, fs::path dir);
	BABELBRIDGE_API int TrainDeltas(const PipelineContext & ctx, int numleaves, int totgauss, fs::path data, fs::path lang, fs::path alidir, fs::path dir);
	BABELBRIDGE_API int TrainLdaMllt(const PipelineContext & ctx, int numleaves, int totgauss, fs::path data, fs::path lang, fs::path alidir, fs::path dir);
	BABELBRIDGE_API int TrainSat(const PipelineContext & ctx, int numleaves, int totgauss, fs::path data, fs::path lang, fs::path alidir, fs::path dir);
	BABELBRIDGE_API int AlignSi(const PipelineContext & ctx, int nj, fs::path data, fs::path lang, fs::path srcdir, fs::path dir);
	BABELBRIDGE_API int AlignFmllr(const PipelineContext & ctx, int nj, fs::path data, fs::path lang, fs::path srcdir, fs::path dir);
	//pronunciation and silence probabilities from the alignments of 'modeldir' into a new dict and lang directory
	BABELBRIDGE_API int ReestimateLangp(const PipelineContext & ctx, fs::path data, fs::path lang, fs::path dict,
		fs::path modeldir, fs::path dictp, fs::path langp, fs::path langout);

	//---------------------------------------------------------------------------------------------------
	// training chain (stage 5)
	//---------------------------------------------------------------------------------------------------
	enum class AlignKind { None, Si, Fmllr };
	enum class TrainKind { None, Mono, Deltas, LdaMllt, Sat };

	struct BABELBRIDGE_API TrainStep
	{
		std::string name;		//the output is exp/<name>
		fs::path data;
		AlignKind align;
		std::string align_src;	//exp/<align_src> is aligned into exp/<align_dir>
		std::string align_dir;
		int align_nj;
		TrainKind train;
		int num_leaves;
		int num_gauss;
		int train_nj;
		bool reestimate;		//the step's model re-estimates the lang directory for the next steps
	};

	BABELBRIDGE_API std::vector<TrainStep> UniversalTrainingChain(const Params & params);
	BABELBRIDGE_API int CreateTrainingSubsets(const PipelineContext & ctx);
	BABELBRIDGE_API int RunTrainingChain(const PipelineContext & ctx, const std::vector<TrainStep> & chain);
	//the lang directory used by the steps after 'step'
	BABELBRIDGE_API fs::path ReestimatedLang(const Params & params, const std::string & step);

	//---------------------------------------------------------------------------------------------------
	// stages 6 and 7
	//---------------------------------------------------------------------------------------------------
	BABELBRIDGE_API int RunCleanupSegmentation(const PipelineContext & ctx);
	BABELBRIDGE_API int RunChainTraining(const PipelineContext & ctx);

	//registers stages 0..7 of the universal acoustic model recipe
	BABELBRIDGE_API void AddUniversalStages(StageRunner & runner, const PipelineContext & ctx);
}
