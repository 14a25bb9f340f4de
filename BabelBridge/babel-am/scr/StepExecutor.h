/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/
#pragma once

#include <babel-am/stdafx.h>

namespace BabelBridge {

	//one invocation of an external toolkit script (data preparation, training, alignment, ...)
	struct BABELBRIDGE_API ToolkitCommand
	{
		std::string label;		//short name used in the log, e.g. "tri1.train_deltas"
		fs::path workdir;		//the script runs in this directory (it sources ./path.sh, ./cmd.sh)
		std::string script;		//relative to workdir, e.g. "steps/train_deltas.sh"
		string_vec args;
		fs::path log;			//stdout and stderr of the script

		std::string ToString() const;
	};

	/*
		Submits a step to the job dispatcher and blocks until it finishes. The scripts fan out their own
		parallel jobs through the dispatcher command (--cmd); any failed job makes the script and therefore
		the whole step fail. There is no retry at this level.
		Returns BB_OK or BB_STEP_FAILURE.
	*/
	class BABELBRIDGE_API StepExecutor
	{
	public:
		virtual ~StepExecutor() {}
		virtual int Run(const ToolkitCommand & cmd) = 0;
	};

	//runs the script as a child process with Boost.Process
	class BABELBRIDGE_API ProcessStepExecutor : public StepExecutor
	{
	public:
		int Run(const ToolkitCommand & cmd) override;
	};
}
