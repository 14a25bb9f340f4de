/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "babel-am/scr/babel_scr.h"
#include "babel-am/scr/Pipeline.h"
#include "babel-am/scr/ConfigMatcher.h"

namespace BabelBridge {

	//creates or keeps the symbolic link 'link' -> 'target'
	static int MakeLink(const std::string & item, fs::path target, fs::path link)
	{
		try {
			if (fs::is_symlink(link)) {
				if (fs::read_symlink(link) == target) return BB_OK;
				fs::remove(link);
			}
			else if (fs::exists(link)) {
				LOGTW_ERROR << "[" << item << "] " << link.string() << " exists and it is not a link.";
				return BB_CONFIGURATION_ERROR;
			}
			if (fs::is_directory(target)) fs::create_directory_symlink(target, link);
			else fs::create_symlink(target, link);
		}
		catch (const std::exception& ex) {
			LOGTW_ERROR << "[" << item << "] Could not link " << link.string() << " to " << target.string() << ". " << ex.what();
			return BB_ERROR;
		}
		return BB_OK;
	}

	//literal text as a boost::regex replacement string
	static std::string FormatEscape(const std::string & s)
	{
		std::string r(s);
		ReplaceStringInPlace(r, "\\", "\\\\");
		ReplaceStringInPlace(r, "$", "$$");
		return r;
	}

	static int BindItemConfig(const Params & params, const std::string & item, fs::path conf, fs::path langconf)
	{
		if (params.lang_conf_rewrite_from.empty())
			return MakeLink(item, conf, langconf);

		//a rewritten copy instead of the link
		try {
			if (fs::is_symlink(langconf)) fs::remove(langconf);
		}
		catch (const std::exception& ex) {
			LOGTW_ERROR << "[" << item << "] Could not remove " << langconf.string() << ". " << ex.what();
			return BB_ERROR;
		}
		std::vector<std::pair<std::string, std::string>> filter;
		filter.push_back(std::make_pair(RegexEscape(params.lang_conf_rewrite_from), FormatEscape(params.lang_conf_rewrite_to)));
		if (FilterFile(conf, langconf, filter) < 0) {
			LOGTW_ERROR << "[" << item << "] Could not write " << langconf.string() << ".";
			return BB_ERROR;
		}
		return BB_OK;
	}

	/*
		Creates the workspace data/<item> of an item: links to the shared resources of the project, copies of
		the files each item needs its own copy of, and lang.conf bound to the configuration file of the item.
		Running it again on an existing workspace keeps what is already correct.
	*/
	int SetupItemWorkspace(const PipelineContext & ctx, const std::string & item)
	{
		const Params & params = ctx.params;
		fs::path dir(params.ItemDir(item));
		return RunGatedStep(ctx, dir, item, [&]() -> int {
			//nothing is created for an item without configuration
			fs::path conf;
			int ret = ResolveItemConfig(params, item, conf);
			if (ret < 0) return ret;

			if (CreateDir(dir, false) < 0) return BB_ERROR;

			for (const std::string & r : params.shared_resources) {
				fs::path target(params.pth_project_base / r);
				if (!fs::exists(target)) {
					LOGTW_ERROR << "[" << item << "] The shared resource " << target.string() << " does not exist.";
					return BB_CONFIGURATION_ERROR;
				}
				ret = MakeLink(item, target, dir / r);
				if (ret < 0) return ret;
			}

			for (const std::string & f : params.copied_files) {
				fs::path src(params.pth_project_base / f);
				try {
					if (!fs::exists(src)) {
						LOGTW_ERROR << "[" << item << "] " << src.string() << " does not exist.";
						return BB_CONFIGURATION_ERROR;
					}
					fs::copy_file(src, dir / f, fs::copy_option::overwrite_if_exists);
				}
				catch (const std::exception& ex) {
					LOGTW_ERROR << "[" << item << "] Could not copy " << src.string() << ". " << ex.what();
					return BB_ERROR;
				}
			}

			ret = BindItemConfig(params, item, conf, dir / "lang.conf");
			if (ret < 0) return ret;

			LOGTW_INFO << "[" << item << "] Workspace " << dir.string() << " is ready.";
			return BB_OK;
		});
	}
}
