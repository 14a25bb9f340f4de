/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/
#include "Params.h"
#include "Status.h"
#include "babel-am/utility/Utility2.h"
#include "babel-am/utility/strvec2arg.h"
#include "util/parse-options.h"
#include "util/text-utils.h"

BabelBridge::Params::Params(void)
	: tier(ResourceTier::Limited),
	id_delimiter("_"),
	train_cmd("run.pl"),
	oov_symbol("<unk>"),
	boost_sil(1.5),
	train_nj(32), mono_nj(8), sub2_ali_nj(12), sub3_ali_nj(24),
	num_leaves_tri1(1000), num_gauss_tri1(10000),
	num_leaves_tri2(1000), num_gauss_tri2(20000),
	num_leaves_tri3(6000), num_gauss_tri3(75000),
	num_leaves_mllt(6000), num_gauss_mllt(75000),
	num_leaves_sat(6000), num_gauss_sat(75000),
	cleanup_script("local/run_cleanup_segmentation.sh"),
	chain_script("local/chain/run_tdnn.sh"),
	chain_stage(4),
	num_workers((int)std::thread::hardware_concurrency()),
	log_file("babel_universal_am.log"),
	langs_opt("101 102 103 104 105 106 202 203 204 205 206 207 301 302 303 304 305 306 401 402 403"),
	tier_opt("limited"),
	limited_conf_patterns_opt("{id}-*limitedLP*.conf {id}-*LLP*.conf"),
	full_conf_patterns_opt("{id}-*fullLP*.conf {id}-*FLP*.conf"),
	shared_resources_opt("local utils steps conf"),
	copied_files_opt("cmd.sh path.sh"),
	subset_sizes_opt("5000 10000 20000"),
	lang_conf_dir_opt("conf/lang"),
	phone_maps_dir_opt("universal_phone_maps")
{
	lang_conf_rewrite_from = "export/babel/data/splits";
	lang_conf_rewrite_to = "export/babel/data/OtherLR-data/splits";
	if (num_workers < 1) num_workers = 1;
}

BABELBRIDGE_API void BabelBridge::Params::Register(kaldi::OptionsItf * po)
{
	//items
	po->Register("langs", &langs_opt, "Space separated list of the item (language) identifiers.");
	po->Register("tier", &tier_opt, "Resource tier of the per-item configuration: limited (limitedLP/LLP) or full (fullLP/FLP).");
	po->Register("limited-conf-patterns", &limited_conf_patterns_opt, "Ranked file name patterns for the limited tier; {id} is the item id.");
	po->Register("full-conf-patterns", &full_conf_patterns_opt, "Ranked file name patterns for the full tier; {id} is the item id.");
	po->Register("lang-conf-dir", &lang_conf_dir_opt, "Directory (relative to the project) searched for the per-item configuration files.");
	po->Register("lang-conf-rewrite-from", &lang_conf_rewrite_from, "Regex rewritten in the item configuration (empty: link the file unchanged).");
	po->Register("lang-conf-rewrite-to", &lang_conf_rewrite_to, "Replacement of --lang-conf-rewrite-from.");
	po->Register("shared-resources", &shared_resources_opt, "Project directories linked into every item workspace.");
	po->Register("copied-files", &copied_files_opt, "Project files copied into every item workspace.");
	po->Register("phone-maps-dir", &phone_maps_dir_opt, "Directory with the diphthongs/<id> and tones/<id> rule tables.");
	po->Register("id-delimiter", &id_delimiter, "Delimiter between the item id and the utterance/speaker id. Source ids starting with <item><delimiter> are taken as already prefixed.");
	//training
	po->Register("train-cmd", &train_cmd, "Job dispatcher command passed as --cmd to the toolkit steps.");
	po->Register("oov-symbol", &oov_symbol, "Out of vocabulary word.");
	po->Register("boost-sil", &boost_sil, "Factor by which to boost silence likelihoods in alignment.");
	po->Register("train-nj", &train_nj, "Number of jobs for the full corpus steps.");
	po->Register("mono-nj", &mono_nj, "Number of jobs for the monophone training.");
	po->Register("sub2-ali-nj", &sub2_ali_nj, "Number of jobs for the alignment of train_sub2.");
	po->Register("sub3-ali-nj", &sub3_ali_nj, "Number of jobs for the alignment of train_sub3.");
	po->Register("num-leaves-tri1", &num_leaves_tri1, "Number of leaves of tri1.");
	po->Register("num-gauss-tri1", &num_gauss_tri1, "Number of Gaussians of tri1.");
	po->Register("num-leaves-tri2", &num_leaves_tri2, "Number of leaves of tri2.");
	po->Register("num-gauss-tri2", &num_gauss_tri2, "Number of Gaussians of tri2.");
	po->Register("num-leaves-tri3", &num_leaves_tri3, "Number of leaves of tri3.");
	po->Register("num-gauss-tri3", &num_gauss_tri3, "Number of Gaussians of tri3.");
	po->Register("num-leaves-mllt", &num_leaves_mllt, "Number of leaves of the LDA+MLLT model (tri4).");
	po->Register("num-gauss-mllt", &num_gauss_mllt, "Number of Gaussians of the LDA+MLLT model (tri4).");
	po->Register("num-leaves-sat", &num_leaves_sat, "Number of leaves of the SAT model (tri5).");
	po->Register("num-gauss-sat", &num_gauss_sat, "Number of Gaussians of the SAT model (tri5).");
	po->Register("subset-sizes", &subset_sizes_opt, "Utterance counts of train_sub1, train_sub2 and train_sub3.");
	po->Register("cleanup-script", &cleanup_script, "Cleanup and segmentation script (stage 6).");
	po->Register("chain-script", &chain_script, "Chain model training script (stage 7).");
	po->Register("chain-stage", &chain_stage, "Value of --stage passed to the chain model training script.");
	//execution
	po->Register("num-workers", &num_workers, "Number of items processed in parallel.");
	po->Register("log-file", &log_file, "Log file (relative to the project directory).");
}

BABELBRIDGE_API int BabelBridge::Params::Read(const string_vec & options)
{
	kaldi::ParseOptions po("");
	Register(&po);
	StrVec2Arg args(options);
	try {
		po.Read(args.argc(), args.argv());
	}
	catch (const std::exception& ex) {
		LOGTW_ERROR << "Could not read the options. " << ex.what();
		return BB_CONFIGURATION_ERROR;
	}
	if (po.NumArgs() > 0) {
		LOGTW_ERROR << "Unexpected positional argument: " << po.GetArg(1);
		return BB_CONFIGURATION_ERROR;
	}
	return BB_OK;
}

BABELBRIDGE_API int BabelBridge::Params::Init(fs::path project_base_dir)
{
	if (GetOptionsVector(langs_opt, langs) < 0) return BB_CONFIGURATION_ERROR;
	if (GetOptionsVector(limited_conf_patterns_opt, limited_conf_patterns) < 0) return BB_CONFIGURATION_ERROR;
	if (GetOptionsVector(full_conf_patterns_opt, full_conf_patterns) < 0) return BB_CONFIGURATION_ERROR;
	if (GetOptionsVector(shared_resources_opt, shared_resources) < 0) return BB_CONFIGURATION_ERROR;
	if (GetOptionsVector(copied_files_opt, copied_files) < 0) return BB_CONFIGURATION_ERROR;
	if (GetIntOptionsVector(subset_sizes_opt, subset_sizes) < 0) return BB_CONFIGURATION_ERROR;

	if (tier_opt == "limited") tier = ResourceTier::Limited;
	else if (tier_opt == "full") tier = ResourceTier::Full;
	else {
		LOGTW_ERROR << "Unknown resource tier '" << tier_opt << "'. Use limited or full.";
		return BB_CONFIGURATION_ERROR;
	}

	//item ids are used in file names and as id prefix; the delimiter must separate them unambiguously
	if (langs.size() < 1) {
		LOGTW_ERROR << "No items (languages) defined.";
		return BB_CONFIGURATION_ERROR;
	}
	if (id_delimiter.empty() || !kaldi::IsToken(id_delimiter)) {
		LOGTW_ERROR << "Invalid id delimiter '" << id_delimiter << "'.";
		return BB_CONFIGURATION_ERROR;
	}
	for (const std::string & l : langs) {
		if (!kaldi::IsToken(l) || l.find(id_delimiter) != std::string::npos || l.find('/') != std::string::npos) {
			LOGTW_ERROR << "Invalid item id '" << l << "'. It must be one token without '/' and without the delimiter '" << id_delimiter << "'.";
			return BB_CONFIGURATION_ERROR;
		}
	}
	if (!is_unique(langs)) {
		LOGTW_ERROR << "The item list contains duplicates: " << langs_opt;
		return BB_CONFIGURATION_ERROR;
	}
	if (TierPatterns().size() < 1) {
		LOGTW_ERROR << "No configuration file patterns for tier " << tier_opt << ".";
		return BB_CONFIGURATION_ERROR;
	}
	if (subset_sizes.size() != 3 || subset_sizes[0] < 1 || subset_sizes[0] >= subset_sizes[1] || subset_sizes[1] >= subset_sizes[2]) {
		LOGTW_ERROR << "Three increasing subset sizes are expected instead of: " << subset_sizes_opt;
		return BB_CONFIGURATION_ERROR;
	}
	if (train_nj < 1 || mono_nj < 1 || sub2_ali_nj < 1 || sub3_ali_nj < 1 || num_workers < 1) {
		LOGTW_ERROR << "The number of jobs and workers must be positive.";
		return BB_CONFIGURATION_ERROR;
	}
	if (train_cmd.empty()) {
		LOGTW_ERROR << "No job dispatcher command (--train-cmd) defined.";
		return BB_CONFIGURATION_ERROR;
	}

	try {
		if (!fs::exists(project_base_dir)) {
			LOGTW_ERROR << "The project directory " << project_base_dir.string() << " does not exist.";
			return BB_CONFIGURATION_ERROR;
		}
		pth_project_base = fs::canonical(project_base_dir);
	}
	catch (const std::exception& ex) {
		LOGTW_ERROR << "Invalid project directory " << project_base_dir.string() << ". " << ex.what();
		return BB_CONFIGURATION_ERROR;
	}

	pth_data = pth_project_base / "data";
	pth_exp = pth_project_base / "exp";
	pth_log = pth_exp / "log";
	pth_conf_lang = pth_project_base / lang_conf_dir_opt;
	pth_phone_maps = pth_project_base / phone_maps_dir_opt;
	pth_train = pth_data / "train";
	pth_dict_universal = pth_data / "dict_universal";
	pth_lang_universal = pth_data / "lang_universal";
	pth_lang_universalp = pth_data / "lang_universalp";
	pth_stage_markers = pth_exp / ".stages";

	return BB_OK;
}

BABELBRIDGE_API string_vec BabelBridge::Params::GetOptions() const
{
	string_vec _o;
	_o.push_back("--langs=" + join_vector(langs, " "));
	_o.push_back(std::string("--tier=") + (tier == ResourceTier::Limited ? "limited" : "full"));
	_o.push_back("--limited-conf-patterns=" + join_vector(limited_conf_patterns, " "));
	_o.push_back("--full-conf-patterns=" + join_vector(full_conf_patterns, " "));
	_o.push_back("--lang-conf-dir=" + lang_conf_dir_opt);
	_o.push_back("--lang-conf-rewrite-from=" + lang_conf_rewrite_from);
	_o.push_back("--lang-conf-rewrite-to=" + lang_conf_rewrite_to);
	_o.push_back("--shared-resources=" + join_vector(shared_resources, " "));
	_o.push_back("--copied-files=" + join_vector(copied_files, " "));
	_o.push_back("--phone-maps-dir=" + phone_maps_dir_opt);
	_o.push_back("--id-delimiter=" + id_delimiter);
	_o.push_back("--train-cmd=" + train_cmd);
	_o.push_back("--oov-symbol=" + oov_symbol);
	std::ostringstream bs;
	bs << boost_sil;
	_o.push_back("--boost-sil=" + bs.str());
	_o.push_back("--train-nj=" + std::to_string(train_nj));
	_o.push_back("--mono-nj=" + std::to_string(mono_nj));
	_o.push_back("--sub2-ali-nj=" + std::to_string(sub2_ali_nj));
	_o.push_back("--sub3-ali-nj=" + std::to_string(sub3_ali_nj));
	_o.push_back("--num-leaves-tri1=" + std::to_string(num_leaves_tri1));
	_o.push_back("--num-gauss-tri1=" + std::to_string(num_gauss_tri1));
	_o.push_back("--num-leaves-tri2=" + std::to_string(num_leaves_tri2));
	_o.push_back("--num-gauss-tri2=" + std::to_string(num_gauss_tri2));
	_o.push_back("--num-leaves-tri3=" + std::to_string(num_leaves_tri3));
	_o.push_back("--num-gauss-tri3=" + std::to_string(num_gauss_tri3));
	_o.push_back("--num-leaves-mllt=" + std::to_string(num_leaves_mllt));
	_o.push_back("--num-gauss-mllt=" + std::to_string(num_gauss_mllt));
	_o.push_back("--num-leaves-sat=" + std::to_string(num_leaves_sat));
	_o.push_back("--num-gauss-sat=" + std::to_string(num_gauss_sat));
	_o.push_back("--subset-sizes=" + join_vector(subset_sizes, " "));
	_o.push_back("--cleanup-script=" + cleanup_script);
	_o.push_back("--chain-script=" + chain_script);
	_o.push_back("--chain-stage=" + std::to_string(chain_stage));
	_o.push_back("--num-workers=" + std::to_string(num_workers));
	_o.push_back("--log-file=" + log_file);
	return _o;
}

BABELBRIDGE_API fs::path BabelBridge::Params::ItemDir(const std::string & item) const
{
	return pth_data / item;
}

BABELBRIDGE_API fs::path BabelBridge::Params::ItemTrainDir(const std::string & item) const
{
	return ItemDir(item) / "data" / "train";
}

BABELBRIDGE_API fs::path BabelBridge::Params::ItemRawLexicon(const std::string & item) const
{
	return ItemDir(item) / "data" / "local" / "lexicon.txt";
}

BABELBRIDGE_API fs::path BabelBridge::Params::ItemDictDir(const std::string & item) const
{
	return ItemDir(item) / "data" / "dict_universal";
}

BABELBRIDGE_API fs::path BabelBridge::Params::ItemPrefixedTrainDir(const std::string & item) const
{
	return ItemDir(item) / "data" / ("train_" + item);
}

BABELBRIDGE_API fs::path BabelBridge::Params::ItemDiphthongs(const std::string & item) const
{
	return pth_phone_maps / "diphthongs" / item;
}

BABELBRIDGE_API fs::path BabelBridge::Params::ItemTones(const std::string & item) const
{
	return pth_phone_maps / "tones" / item;
}

BABELBRIDGE_API fs::path BabelBridge::Params::SubsetDir(int n) const
{
	return pth_data / ("train_sub" + std::to_string(n));
}

BABELBRIDGE_API const string_vec & BabelBridge::Params::TierPatterns() const
{
	return tier == ResourceTier::Limited ? limited_conf_patterns : full_conf_patterns;
}

BABELBRIDGE_API std::string BabelBridge::Params::StepId(const fs::path & p) const
{
	std::string s(p.generic_string());
	std::string base(pth_project_base.generic_string());
	if (!base.empty() && s.compare(0, base.size(), base) == 0) {
		s = s.substr(base.size());
		while (!s.empty() && s[0] == '/') s = s.substr(1);
	}
	return s;
}
