/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/
#include "StepExecutor.h"
#include "Status.h"
#include "babel-am/utility/Utility.h"

#include <boost/process.hpp>

namespace bp = boost::process;

namespace BabelBridge {

	std::string ToolkitCommand::ToString() const
	{
		std::string s(script);
		for (const std::string & a : args) {
			if (a.find_first_of(" \t") != std::string::npos) s += " \"" + a + "\"";
			else s += " " + a;
		}
		return s;
	}

	int ProcessStepExecutor::Run(const ToolkitCommand & cmd)
	{
		fs::path exe(cmd.workdir / cmd.script);
		try {
			if (!fs::exists(exe)) {
				LOGTW_ERROR << "[" << cmd.label << "] " << exe.string() << " does not exist.";
				return BB_STEP_FAILURE;
			}
			if (!cmd.log.parent_path().empty() && !fs::exists(cmd.log.parent_path()))
				fs::create_directories(cmd.log.parent_path());
		}
		catch (const std::exception& ex) {
			LOGTW_ERROR << "[" << cmd.label << "] " << ex.what();
			return BB_STEP_FAILURE;
		}

		LOGTW_INFO << "[" << cmd.label << "] " << cmd.ToString();
		LOGTW_INFO << "  log: " << cmd.log.string();
		int rc = 0;
		try {
			//NOTE: the working directory of this process is not changed; the workers run in parallel
			bp::child c(bp::exe = exe.string(), bp::args = cmd.args,
				bp::start_dir = cmd.workdir.string(),
				(bp::std_out & bp::std_err) > cmd.log);
			c.wait();
			rc = c.exit_code();
		}
		catch (const std::exception& ex) {
			LOGTW_ERROR << "[" << cmd.label << "] Could not run " << exe.string() << ". " << ex.what();
			return BB_STEP_FAILURE;
		}
		if (rc != 0) {
			LOGTW_ERROR << "[" << cmd.label << "] " << cmd.script << " failed with exit status " << rc << ". See " << cmd.log.string();
			return BB_STEP_FAILURE;
		}
		return BB_OK;
	}
}
