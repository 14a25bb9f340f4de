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

	/*
		Completion state of the pipeline steps. A step id is the output directory of the step relative to the
		project (e.g. "exp/tri1", "data/101/data/train"). A completed step is never redone.
		Implementations must be safe to call from the item worker threads.
	*/
	class BABELBRIDGE_API StateStore
	{
	public:
		virtual ~StateStore() {}
		virtual bool IsComplete(const std::string & stepId) const = 0;
		//returns 0 on success, a negative BabelStatus on failure
		virtual int MarkComplete(const std::string & stepId) = 0;
	};

	//The state is the presence of the '.done' file in the step's output directory: <base>/<stepId>/.done
	class BABELBRIDGE_API MarkerStateStore : public StateStore
	{
	public:
		explicit MarkerStateStore(fs::path base);
		bool IsComplete(const std::string & stepId) const override;
		int MarkComplete(const std::string & stepId) override;
		fs::path MarkerPath(const std::string & stepId) const;

	private:
		fs::path m_base;
	};

	//in memory state (tests, dry runs)
	class BABELBRIDGE_API MemoryStateStore : public StateStore
	{
	public:
		bool IsComplete(const std::string & stepId) const override;
		int MarkComplete(const std::string & stepId) override;
		std::vector<std::string> Completed() const;

	private:
		mutable std::mutex m_mutex;
		std::set<std::string> m_done;
	};
}
