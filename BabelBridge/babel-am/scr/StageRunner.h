/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/
#pragma once

#include <babel-am/stdafx.h>
#include "babel-am/scr/StateStore.h"

namespace BabelBridge {

	using StageBody = std::function<int()>;

	struct BABELBRIDGE_API Stage
	{
		int ordinal;
		std::string label;
		StageBody body;
	};

	/*
		Runs the stages in ascending order of their ordinal.
		- Run(threshold) executes the body of stage S only if threshold <= S ("resume from threshold").
		  The stages below the threshold count as done; the marker of the stage right before the threshold
		  must exist, otherwise BB_STATE_ERROR is returned without running anything.
		- A stage with a completion marker is skipped, whatever the threshold is.
		- The marker of a stage is written only after its body returned success.
		- The first failing stage stops the run and its status is returned. An exception thrown by a body
		  is logged and counts as BB_ERROR.
		Stage markers are stored in the state store under "<marker prefix>/<ordinal>".
	*/
	class BABELBRIDGE_API StageRunner
	{
	public:
		StageRunner(StateStore & state, std::string markerPrefix);

		void AddStage(int ordinal, std::string label, StageBody body);
		int Run(int threshold);

		std::string StageId(int ordinal) const;

	private:
		StateStore & m_state;
		std::string m_markerPrefix;
		std::vector<Stage> m_stages;
	};
}
