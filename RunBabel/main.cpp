/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "BabelBridge/BabelBridge.h"
#include "util/parse-options.h"

/*
INFO
====

Trains a universal acoustic model on the BABEL languages:
	stage 0 -- set up the item (language) workspaces
	stage 1 -- prepare the item data
	stage 2 -- prepare the item lexicons
	stage 3 -- add the item prefix to the data ids
	stage 4 -- combine data dirs and lexicons, create one universal lang dir
	stage 5 -- training through tri5
	stage 6 -- cleanup data and segmentation
	stage 7 -- chain model training

Every completed step leaves a '.done' file in its output directory and is not run again. Start a new run
with --stage=N to continue from stage N (stage N-1 must be complete).

LOGGING:
	- LOGTW_INFO, LOGTW_WARNING, LOGTW_ERROR, LOGTW_FATALERROR, LOGTW_DEBUG write to the global log file
	  (<project>/babel_universal_am.log) and to the screen.
	- Kaldi messages (KALDI_ERR, KALDI_WARN, KALDI_LOG) are routed to the same log.
	- the output of each toolkit script goes to exp/log/<step>.log.
*/
int main(int argc, char *argv[])
{
	const char *usage =
		"Trains a universal acoustic model on several languages.\n"
		"Usage: babel_universal_am [options]\n"
		"e.g.: babel_universal_am --stage=4 --config=conf/universal.conf --project-dir=/export/babel_am\n";

	kaldi::ParseOptions po(usage);
	BabelBridge::Params params;
	int stage = 0;
	std::string project_dir = ".";
	po.Register("stage", &stage, "Start from this stage (the stages before it must be complete).");
	po.Register("project-dir", &project_dir, "The recipe directory (data/, exp/, conf/, local/, steps/, utils/).");
	params.Register(&po);

	ReplaceKaldiLogHandlerEx();
	try {
		po.Read(argc, argv);
	}
	catch (const std::exception& ex) {
		LOGTW_ERROR << "Invalid options. " << ex.what();
		return 1;
	}
	if (po.NumArgs() != 0) {
		po.PrintUsage();
		return 1;
	}

	int ret = params.Init(project_dir);
	if (ret < 0) {
		LOGTW_ERROR << "Invalid configuration: " << StatusName(ret) << ".";
		return 1;
	}

	//init general app level log
	oTwinLog.init((params.pth_project_base / params.log_file).string());

	LOGTW_INFO << "*************************************";
	LOGTW_INFO << "* BABEL UNIVERSAL ACOUSTIC MODEL    *";
	LOGTW_INFO << "*************************************";
	LOGTW_INFO << "Project: " << params.pth_project_base.string();
	LOGTW_INFO << "Items: " << join_vector(params.langs, " ");
	LOGTW_INFO << "Starting at stage " << stage << " with " << params.num_workers << " item workers.";

	if (CreateDir(params.pth_log, false) < 0) return 1;
	if (SaveOptionsToFile(params.pth_exp / "babel_universal_am.options", params.GetOptions()) < 0)
		LOGTW_WARNING << "Could not save the options.";

	BabelBridge::MarkerStateStore state(params.pth_project_base);
	BabelBridge::ProcessStepExecutor executor;
	BabelBridge::PipelineContext ctx(params, state, executor);
	BabelBridge::StageRunner runner(state, params.StepId(params.pth_stage_markers));
	BabelBridge::AddUniversalStages(runner, ctx);

	ret = runner.Run(stage);

	//final message
	if (ret > -1) {
		LOGTW_INFO << "\n\n";
		LOGTW_INFO << "*****************";
		LOGTW_INFO << "**** ALL OK! ****";
		LOGTW_INFO << "*****************";
	}
	else {
		LOGTW_INFO << "\n\n";
		LOGTW_INFO << "*****************";
		LOGTW_INFO << "****  ERROR! ****";
		LOGTW_INFO << "*****************";
		LOGTW_ERROR << "Failed with " << StatusName(ret) << ". Fix the problem and run again with --stage=<failed stage>.";
	}
	ReplaceKaldiLogHandlerEx(true);
	return ret > -1 ? 0 : 1;
}
