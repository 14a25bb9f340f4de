/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/
#include "StateStore.h"
#include "Status.h"
#include "babel-am/utility/Utility.h"

namespace BabelBridge {

	MarkerStateStore::MarkerStateStore(fs::path base) : m_base(base)
	{
	}

	fs::path MarkerStateStore::MarkerPath(const std::string & stepId) const
	{
		return m_base / stepId / ".done";
	}

	bool MarkerStateStore::IsComplete(const std::string & stepId) const
	{
		try {
			return fs::exists(MarkerPath(stepId));
		}
		catch (const std::exception& ex) {
			LOGTW_WARNING << "Could not check " << MarkerPath(stepId).string() << ". " << ex.what();
			return false;
		}
	}

	int MarkerStateStore::MarkComplete(const std::string & stepId)
	{
		fs::path marker(MarkerPath(stepId));
		try {
			if (!fs::exists(marker.parent_path()))
				fs::create_directories(marker.parent_path());
			//only the presence of the file counts
			fs::ofstream ofs(marker, std::ios::binary | std::ios::out);
			if (!ofs) {
				LOGTW_ERROR << "Could not create the marker " << marker.string() << ".";
				return BB_ERROR;
			}
			ofs.close();
		}
		catch (const std::exception& ex) {
			LOGTW_ERROR << "Could not create the marker " << marker.string() << ". " << ex.what();
			return BB_ERROR;
		}
		return BB_OK;
	}

	bool MemoryStateStore::IsComplete(const std::string & stepId) const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_done.find(stepId) != m_done.end();
	}

	int MemoryStateStore::MarkComplete(const std::string & stepId)
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_done.insert(stepId);
		return BB_OK;
	}

	std::vector<std::string> MemoryStateStore::Completed() const
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		return std::vector<std::string>(m_done.begin(), m_done.end());
	}
}
