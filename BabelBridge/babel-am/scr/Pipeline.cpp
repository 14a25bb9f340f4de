/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/
#include "Pipeline.h"
#include "Status.h"

namespace BabelBridge {

	int RunForEachItem(const string_vec & items, int num_workers, ItemTask task)
	{
		if (items.size() < 1) return BB_OK;
		int nThreads = std::max(1, std::min(num_workers, (int)items.size()));
		//one result per item so that the threads never write the same element
		std::vector<int> _ret(items.size(), BB_OK);
		std::atomic<size_t> next(0);
		std::atomic<bool> failed(false);

		auto worker = [&]() {
			while (!failed.load()) {
				size_t i = next.fetch_add(1);
				if (i >= items.size()) break;
				int ret = BB_ERROR;
				try {
					ret = task(items[i]);
				}
				catch (const std::exception& ex) {
					LOGTW_ERROR << "[" << items[i] << "] " << ex.what();
					ret = BB_ERROR;
				}
				_ret[i] = ret;
				if (ret < 0) failed.store(true);
			}
		};

		//---------------------------------------------------------------------
		//Start parallel processing
		std::vector<std::thread> _threads;
		for (int t = 0; t < nThreads; t++)
			_threads.emplace_back(worker);
		//wait for the threads till they are ready
		for (auto& t : _threads) {
			t.join();
		}
		//check return values from the threads/jobs
		for (size_t i = 0; i < items.size(); i++) {
			if (_ret[i] < 0) {
				LOGTW_ERROR << "Item " << items[i] << " failed: " << StatusName(_ret[i]) << ".";
				return _ret[i];
			}
		}
		//---------------------------------------------------------------------
		return BB_OK;
	}

	int RunGatedStep(const PipelineContext & ctx, const fs::path & outdir, const std::string & label, std::function<int()> body)
	{
		std::string stepId(ctx.params.StepId(outdir));
		if (ctx.state.IsComplete(stepId)) {
			LOGTW_INFO << "[" << label << "] " << stepId << " is already done, skipping.";
			return BB_OK;
		}
		int ret = body();
		if (ret < 0) return ret;
		return ctx.state.MarkComplete(stepId);
	}

	int RequireInputs(const std::string & label, const std::vector<fs::path> & inputs)
	{
		for (const fs::path & p : inputs) {
			bool bExists = false;
			try {
				bExists = fs::exists(p);
			}
			catch (const std::exception& ex) {
				LOGTW_ERROR << "[" << label << "] " << ex.what();
			}
			if (!bExists) {
				LOGTW_ERROR << "[" << label << "] Missing input " << p.string() << ". Was the previous stage completed?";
				return BB_STATE_ERROR;
			}
		}
		return BB_OK;
	}

	std::string Rel(const Params & params, const fs::path & p)
	{
		return params.StepId(p);
	}

	ToolkitCommand MakeCommand(const Params & params, const std::string & label, const std::string & script, const string_vec & args)
	{
		ToolkitCommand cmd;
		cmd.label = label;
		cmd.workdir = params.pth_project_base;
		cmd.script = script;
		cmd.args = args;
		cmd.log = params.pth_log / (label + ".log");
		return cmd;
	}
}
