/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "babel-am/scr/babel_scr.h"
#include "babel-am/scr/Pipeline.h"

namespace BabelBridge {

	int CombineItemData(const PipelineContext & ctx)
	{
		const Params & params = ctx.params;
		return RunGatedStep(ctx, params.pth_train, "combine_data", [&]() -> int {
			std::vector<std::pair<std::string, fs::path>> srcs;
			for (const std::string & l : params.langs)
				srcs.push_back(std::make_pair(l, params.ItemPrefixedTrainDir(l)));
			return CombineDataDirs(params.pth_train, srcs);
		});
	}

	int CombineItemLexicons(const PipelineContext & ctx)
	{
		const Params & params = ctx.params;
		return RunGatedStep(ctx, params.pth_dict_universal, "combine_lexicons", [&]() -> int {
			std::vector<std::pair<std::string, fs::path>> dicts;
			for (const std::string & l : params.langs)
				dicts.push_back(std::make_pair(l, params.ItemDictDir(l)));
			return CombineLexicons(params.pth_dict_universal, dicts);
		});
	}

	int PrepareUniversalLang(const PipelineContext & ctx)
	{
		const Params & params = ctx.params;
		return RunGatedStep(ctx, params.pth_lang_universal, "prepare_lang", [&]() -> int {
			return PrepareLang(ctx, "lang_universal.prepare_lang", params.pth_dict_universal,
				params.pth_dict_universal / "tmp.lang", params.pth_lang_universal);
		});
	}
}
