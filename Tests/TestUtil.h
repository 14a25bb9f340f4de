/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/
#pragma once

#include "BabelBridge/BabelBridge.h"

#include <gtest/gtest.h>

//a fresh directory under the system temp directory, removed with its contents at the end of the scope
class TempDir
{
public:
	TempDir();
	~TempDir();
	const fs::path & path() const { return m_path; }

private:
	fs::path m_path;
};

void WriteFile(fs::path p, const std::string & content);
std::string ReadFile(fs::path p);
string_vec ReadNonEmptyLines(fs::path p);

/*
	Step executor for the tests: records the commands instead of running them and creates what the real
	scripts would leave behind so that the next steps find their inputs:
	- local/prepare_data.sh writes a small corpus (data/train) and a raw lexicon (data/local/lexicon.txt)
	- the training, alignment and lang scripts create their output directory (the last argument)
	Scripts listed in 'fail' return BB_STEP_FAILURE.
*/
class RecordingStepExecutor : public BabelBridge::StepExecutor
{
public:
	int Run(const BabelBridge::ToolkitCommand & cmd) override;

	std::vector<BabelBridge::ToolkitCommand> Commands() const;
	//the commands as "<script> <args>" strings
	string_vec CommandLines() const;
	int Count(const std::string & script) const;

	std::set<std::string> fail;
	//the raw lexicon written by local/prepare_data.sh for each item (default: a common lexicon)
	std::map<std::string, std::string> lexicons;

private:
	mutable std::mutex m_mutex;
	std::vector<BabelBridge::ToolkitCommand> m_commands;
};

/*
	A recipe directory with everything stage 0 needs: conf/lang/<item>-*-limitedLP.conf for each item,
	local/prepare_data.sh, steps/, utils/, cmd.sh and path.sh.
*/
void CreateRecipeDir(fs::path base, const string_vec & items_with_conf);

//parameters for a recipe directory; the options are "--name=value" strings
int InitParams(BabelBridge::Params & params, fs::path base, const string_vec & options);
