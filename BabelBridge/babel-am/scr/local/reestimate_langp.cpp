/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "babel-am/scr/Pipeline.h"
#include "babel-am/scr/Status.h"

namespace BabelBridge {

	/*
		Re-estimates the pronunciation and silence probabilities of 'dict' from the alignments of 'modeldir':
		1. steps/get_prons.sh counts the pronunciations in the alignments
		2. utils/dict_dir_add_pronprobs.sh writes the dictionary with probabilities to 'dictp'
		3. utils/prepare_lang.sh builds 'langout' from 'dictp' keeping the phone ids of 'lang'
	*/
	int ReestimateLangp(const PipelineContext & ctx, fs::path data, fs::path lang, fs::path dict,
		fs::path modeldir, fs::path dictp, fs::path langp, fs::path langout)
	{
		const Params & params = ctx.params;
		std::string step(modeldir.filename().string());
		int ret = RequireInputs(step + ".reestimate", { data, lang, dict, modeldir });
		if (ret < 0) return ret;

		ToolkitCommand prons = MakeCommand(params, step + ".get_prons", "steps/get_prons.sh", {
			"--cmd", params.train_cmd,
			Rel(params, data), Rel(params, lang), Rel(params, modeldir) });
		ret = ctx.executor.Run(prons);
		if (ret < 0) return ret;

		ToolkitCommand pronprobs = MakeCommand(params, step + ".dict_dir_add_pronprobs", "utils/dict_dir_add_pronprobs.sh", {
			"--max-normalize", "true",
			Rel(params, dict),
			Rel(params, modeldir / "pron_counts_nowb.txt"),
			Rel(params, modeldir / "sil_counts_nowb.txt"),
			Rel(params, modeldir / "pron_bigram_counts_nowb.txt"),
			Rel(params, dictp) });
		ret = ctx.executor.Run(pronprobs);
		if (ret < 0) return ret;

		return PrepareLang(ctx, step + ".prepare_lang", dictp, langp, langout, lang / "phones.txt");
	}
}
