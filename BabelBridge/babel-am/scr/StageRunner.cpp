/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/
#include "StageRunner.h"
#include "Status.h"
#include "babel-am/utility/Utility.h"

namespace BabelBridge {

	StageRunner::StageRunner(StateStore & state, std::string markerPrefix)
		: m_state(state), m_markerPrefix(markerPrefix)
	{
	}

	void StageRunner::AddStage(int ordinal, std::string label, StageBody body)
	{
		Stage s;
		s.ordinal = ordinal;
		s.label = label;
		s.body = body;
		m_stages.push_back(s);
		std::stable_sort(m_stages.begin(), m_stages.end(), [](const Stage & a, const Stage & b) { return a.ordinal < b.ordinal; });
	}

	std::string StageRunner::StageId(int ordinal) const
	{
		return m_markerPrefix + "/" + std::to_string(ordinal);
	}

	int StageRunner::Run(int threshold)
	{
		if (m_stages.size() < 1) {
			LOGTW_WARNING << "There are no stages to run.";
			return BB_OK;
		}
		if (threshold < 0) {
			LOGTW_ERROR << "Invalid stage " << threshold << ".";
			return BB_CONFIGURATION_ERROR;
		}

		//the stage before the threshold must have been completed by an earlier run
		const Stage * previous = NULL;
		for (const Stage & s : m_stages) {
			if (s.ordinal < threshold) previous = &s;
		}
		if (previous != NULL && !m_state.IsComplete(StageId(previous->ordinal))) {
			LOGTW_ERROR << "Can not start at stage " << threshold << ": stage " << previous->ordinal
				<< " (" << previous->label << ") is not complete.";
			return BB_STATE_ERROR;
		}

		int nRun = 0;
		for (const Stage & s : m_stages) {
			if (s.ordinal < threshold) {
				LOGTW_INFO << "Stage " << s.ordinal << " (" << s.label << "): skipped, below the requested stage " << threshold << ".";
				continue;
			}
			if (m_state.IsComplete(StageId(s.ordinal))) {
				LOGTW_INFO << "Stage " << s.ordinal << " (" << s.label << "): already complete.";
				continue;
			}

			LOGTW_INFO << "---------------------------------------------------------------------";
			LOGTW_INFO << "Stage " << s.ordinal << ": " << s.label;
			LOGTW_INFO << "---------------------------------------------------------------------";
			int ret = BB_ERROR;
			try {
				ret = s.body();
			}
			catch (const std::exception& ex) {
				LOGTW_ERROR << "Stage " << s.ordinal << " (" << s.label << "): " << ex.what();
				ret = BB_ERROR;
			}
			if (ret < 0) {
				LOGTW_ERROR << "Stage " << s.ordinal << " (" << s.label << ") failed: " << StatusName(ret) << ".";
				return ret;
			}
			ret = m_state.MarkComplete(StageId(s.ordinal));
			if (ret < 0) return ret;
			nRun++;
		}
		if (nRun == 0) LOGTW_INFO << "Nothing to do.";
		return BB_OK;
	}
}
