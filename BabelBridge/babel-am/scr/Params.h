/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/
#pragma once

#include <babel-am/stdafx.h>
#include "babel-am/utility/Utility.h"
#include "itf/options-itf.h"

namespace BabelBridge {

	//resource tier of the per-item configuration files (limitedLP/LLP or fullLP/FLP)
	enum class ResourceTier { Limited, Full };

	/*
		The Params class holds all paths, names and tunable parameters of the pipeline.
		It is filled once at startup (Register + command line/config file, then Init) and passed to every stage
		as a const reference; nothing changes it afterwards.

		The options are read with kaldi::ParseOptions, so a config file of '--name=value' lines can be used
		with --config=<file>.
	*/
	class Params
	{
	public:
		BABELBRIDGE_API Params(void);
		//register all options with a Kaldi option parser
		BABELBRIDGE_API void Register(kaldi::OptionsItf * opts);
		//parse options given as "--name=value" strings (can include --config=<file>)
		BABELBRIDGE_API int Read(const string_vec & options);
		//validate the options and derive all paths; returns BB_CONFIGURATION_ERROR on invalid options
		BABELBRIDGE_API int Init(fs::path project_base_dir);
		//the effective options as "--name=value" lines
		BABELBRIDGE_API string_vec GetOptions() const;

		//per-item paths
		BABELBRIDGE_API fs::path ItemDir(const std::string & item) const;
		BABELBRIDGE_API fs::path ItemTrainDir(const std::string & item) const;
		BABELBRIDGE_API fs::path ItemRawLexicon(const std::string & item) const;
		BABELBRIDGE_API fs::path ItemDictDir(const std::string & item) const;
		BABELBRIDGE_API fs::path ItemPrefixedTrainDir(const std::string & item) const;
		BABELBRIDGE_API fs::path ItemDiphthongs(const std::string & item) const;
		BABELBRIDGE_API fs::path ItemTones(const std::string & item) const;
		//data/train_sub<n>, n = 1..3
		BABELBRIDGE_API fs::path SubsetDir(int n) const;
		//the rules of the resource tier in use
		BABELBRIDGE_API const string_vec & TierPatterns() const;
		//path relative to the project base (used as step id for the state store)
		BABELBRIDGE_API std::string StepId(const fs::path & p) const;

		//publicly accesible paths
		fs::path pth_project_base;
		fs::path pth_data;
		fs::path pth_exp;
		fs::path pth_log;
		fs::path pth_conf_lang;
		fs::path pth_phone_maps;
		fs::path pth_train;
		fs::path pth_dict_universal;
		fs::path pth_lang_universal;
		fs::path pth_lang_universalp;
		fs::path pth_stage_markers;

		//items
		string_vec langs;
		ResourceTier tier;
		string_vec limited_conf_patterns;
		string_vec full_conf_patterns;
		string_vec shared_resources;
		string_vec copied_files;
		std::string lang_conf_rewrite_from;
		std::string lang_conf_rewrite_to;
		std::string id_delimiter;

		//training
		std::string train_cmd;
		std::string oov_symbol;
		double boost_sil;
		int train_nj;
		int mono_nj;
		int sub2_ali_nj;
		int sub3_ali_nj;
		int num_leaves_tri1, num_gauss_tri1;
		int num_leaves_tri2, num_gauss_tri2;
		int num_leaves_tri3, num_gauss_tri3;
		int num_leaves_mllt, num_gauss_mllt;
		int num_leaves_sat, num_gauss_sat;
		std::vector<int> subset_sizes;
		std::string cleanup_script;
		std::string chain_script;
		int chain_stage;

		//execution
		int num_workers;
		std::string log_file;

	private:
		//raw list options (space separated) as read by the option parser
		std::string langs_opt;
		std::string tier_opt;
		std::string limited_conf_patterns_opt;
		std::string full_conf_patterns_opt;
		std::string shared_resources_opt;
		std::string copied_files_opt;
		std::string subset_sizes_opt;
		std::string lang_conf_dir_opt;
		std::string phone_maps_dir_opt;
	};
}
