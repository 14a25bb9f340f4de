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

	//runs the data preparation of the item inside its workspace (it reads ./lang.conf)
	int PrepareItemData(const PipelineContext & ctx, const std::string & item)
	{
		const Params & params = ctx.params;
		fs::path dir(params.ItemDir(item));
		return RunGatedStep(ctx, params.ItemTrainDir(item), item, [&]() -> int {
			int ret = RequireInputs(item, { dir / "lang.conf", dir / "local" / "prepare_data.sh" });
			if (ret < 0) return ret;

			ToolkitCommand cmd;
			cmd.label = item + ".prepare_data";
			cmd.workdir = dir;
			cmd.script = "local/prepare_data.sh";
			cmd.log = params.pth_log / (cmd.label + ".log");
			ret = ctx.executor.Run(cmd);
			if (ret < 0) return ret;

			//what the next stages read
			ret = RequireInputs(item, { params.ItemTrainDir(item) / "utt2spk", params.ItemRawLexicon(item) });
			if (ret < 0) {
				LOGTW_ERROR << "[" << item << "] local/prepare_data.sh did not produce the expected output.";
				return ret;
			}
			return BB_OK;
		});
	}

	//the universal dictionary of the item from its raw lexicon and its diphthong and tone tables
	int PrepareItemLexicon(const PipelineContext & ctx, const std::string & item)
	{
		const Params & params = ctx.params;
		return RunGatedStep(ctx, params.ItemDictDir(item), item, [&]() -> int {
			int ret = RequireInputs(item, { params.ItemRawLexicon(item) });
			if (ret < 0) return ret;
			LOGTW_INFO << "[" << item << "] Dictionary " << params.ItemDictDir(item).string();
			PhoneRules rules;
			ret = ReadPhoneRules(params.ItemDiphthongs(item), params.ItemTones(item), rules);
			if (ret < 0) return ret;
			ret = PrepareUniversalLexicon(params.ItemRawLexicon(item), params.ItemDictDir(item), rules);
			if (ret < 0) LOGTW_ERROR << "[" << item << "] Could not prepare the dictionary.";
			return ret;
		});
	}

	//data/<item>/data/train -> data/<item>/data/train_<item> with globally unique ids
	int PrefixItemData(const PipelineContext & ctx, const std::string & item)
	{
		const Params & params = ctx.params;
		return RunGatedStep(ctx, params.ItemPrefixedTrainDir(item), item, [&]() -> int {
			int ret = RequireInputs(item, { params.ItemTrainDir(item) / "utt2spk" });
			if (ret < 0) return ret;
			return PrependItemId(item, params.ItemTrainDir(item), params.ItemPrefixedTrainDir(item), params.id_delimiter);
		});
	}
}
