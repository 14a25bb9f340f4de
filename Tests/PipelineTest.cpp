/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/

#include "TestUtil.h"

using namespace BabelBridge;

//the whole recipe on three items with the recording executor and the marker files of a real run
class PipelineTest : public ::testing::Test
{
protected:
	int RunRecipe(RecordingStepExecutor & executor, int stage = 0)
	{
		MarkerStateStore state(params.pth_project_base);
		PipelineContext ctx(params, state, executor);
		StageRunner runner(state, params.StepId(params.pth_stage_markers));
		AddUniversalStages(runner, ctx);
		return runner.Run(stage);
	}

	void Init(const string_vec & items_with_conf, const string_vec & options)
	{
		CreateRecipeDir(tmp.path(), items_with_conf);
		ASSERT_EQ(BB_OK, InitParams(params, tmp.path(), options));
	}

	TempDir tmp;
	Params params;
};

TEST_F(PipelineTest, AllStages)
{
	Init({ "101", "102", "103" }, { "--langs=101 102 103", "--subset-sizes=2 4 100", "--num-workers=2" });
	RecordingStepExecutor executor;
	ASSERT_EQ(BB_OK, RunRecipe(executor));

	for (int i = 0; i <= 7; i++)
		EXPECT_TRUE(fs::exists(params.pth_stage_markers / std::to_string(i) / ".done")) << "stage " << i;

	//stage 0
	EXPECT_TRUE(fs::is_symlink(params.ItemDir("102") / "steps"));
	EXPECT_TRUE(fs::exists(params.ItemDir("102") / "cmd.sh"));
	EXPECT_FALSE(fs::is_symlink(params.ItemDir("102") / "cmd.sh"));
	EXPECT_TRUE(fs::exists(params.ItemDir("102") / "lang.conf"));
	//stages 1..3
	EXPECT_EQ(3, executor.Count("local/prepare_data.sh"));
	EXPECT_TRUE(fs::exists(params.ItemDictDir("101") / "lexicon.txt"));
	EXPECT_EQ("103_spkB-001 103_spkB", ReadNonEmptyLines(params.ItemPrefixedTrainDir("103") / "utt2spk")[2]);
	//stage 4
	string_vec utt2spk = ReadNonEmptyLines(params.pth_train / "utt2spk");
	ASSERT_EQ(9u, utt2spk.size());
	EXPECT_EQ("101_spkA-001 101_spkA", utt2spk[0]);
	EXPECT_EQ("103_spkB-001 103_spkB", utt2spk[8]);
	EXPECT_EQ(6u, ReadNonEmptyLines(params.pth_train / "spk2utt").size());
	EXPECT_EQ(6u, ReadNonEmptyLines(params.pth_train / "wav.scp").size());
	EXPECT_EQ("102_spkA-002 102", ReadNonEmptyLines(params.pth_train / "utt2lang")[4]);
	EXPECT_TRUE(ReadNonEmptyLines(params.pth_dict_universal / "pron_conflicts.txt").empty());
	EXPECT_TRUE(fs::exists(params.pth_lang_universal / "phones.txt"));
	//stage 5
	EXPECT_EQ(2u, ReadNonEmptyLines(params.SubsetDir(1) / "utt2spk").size());
	EXPECT_EQ(4u, ReadNonEmptyLines(params.SubsetDir(2) / "utt2spk").size());
	EXPECT_TRUE(fs::is_symlink(params.SubsetDir(3)));
	EXPECT_TRUE(fs::exists(params.pth_exp / "tri5_ali" / ".done"));
	EXPECT_TRUE(fs::exists(ReestimatedLang(params, "tri5_ali")));
	//stages 6 and 7
	string_vec lines = executor.CommandLines();
	ASSERT_GE(lines.size(), 2u);
	EXPECT_EQ("local/run_cleanup_segmentation.sh --langdir data/lang_universalp/tri5", lines[lines.size() - 2]);
	EXPECT_EQ("local/chain/run_tdnn.sh --langdir data/lang_universalp/tri5_ali --stage 4", lines.back());
	//the log of every step is in exp/log
	for (const ToolkitCommand & c : executor.Commands())
		EXPECT_EQ(params.pth_log, c.log.parent_path()) << c.label;
}

TEST_F(PipelineTest, SecondRunDoesNothing)
{
	Init({ "101", "102" }, { "--langs=101 102", "--subset-sizes=2 3 4" });
	RecordingStepExecutor first;
	ASSERT_EQ(BB_OK, RunRecipe(first));

	RecordingStepExecutor second;
	ASSERT_EQ(BB_OK, RunRecipe(second));
	EXPECT_EQ(0u, second.Commands().size());
}

TEST_F(PipelineTest, ResumeRerunsOnlyTheUnfinishedWork)
{
	Init({ "101", "102" }, { "--langs=101 102", "--subset-sizes=2 3 4" });
	RecordingStepExecutor first;
	first.fail.insert("steps/train_sat.sh");
	EXPECT_EQ(BB_STEP_FAILURE, RunRecipe(first));
	EXPECT_TRUE(fs::exists(params.pth_stage_markers / "4" / ".done"));
	EXPECT_FALSE(fs::exists(params.pth_stage_markers / "5" / ".done"));

	RecordingStepExecutor second;
	ASSERT_EQ(BB_OK, RunRecipe(second));
	EXPECT_EQ(0, second.Count("local/prepare_data.sh"));
	EXPECT_EQ(0, second.Count("steps/train_mono.sh"));
	EXPECT_EQ(0, second.Count("steps/train_lda_mllt.sh"));
	//tri4 was aligned before the failure but tri5 was not marked
	EXPECT_EQ(1, second.Count("steps/align_si.sh"));
	EXPECT_EQ(1, second.Count("steps/train_sat.sh"));
	EXPECT_EQ(1, second.Count("local/chain/run_tdnn.sh"));
}

TEST_F(PipelineTest, StartAtLaterStage)
{
	Init({ "101" }, { "--langs=101", "--subset-sizes=1 2 3" });
	RecordingStepExecutor first;
	ASSERT_EQ(BB_OK, RunRecipe(first));
	fs::remove(params.pth_stage_markers / "7" / ".done");

	RecordingStepExecutor second;
	ASSERT_EQ(BB_OK, RunRecipe(second, 7));
	string_vec lines = second.CommandLines();
	ASSERT_EQ(1u, lines.size());
	EXPECT_EQ("local/chain/run_tdnn.sh --langdir data/lang_universalp/tri5_ali --stage 4", lines[0]);
}

TEST_F(PipelineTest, StartAtStageWithoutThePreviousOne)
{
	Init({ "101" }, { "--langs=101" });
	RecordingStepExecutor executor;
	EXPECT_EQ(BB_STATE_ERROR, RunRecipe(executor, 5));
	EXPECT_EQ(0u, executor.Commands().size());
}

TEST_F(PipelineTest, MissingItemConfigurationStopsTheRun)
{
	Init({ "101", "103" }, { "--langs=101 102 103", "--num-workers=1" });
	RecordingStepExecutor executor;
	EXPECT_EQ(BB_CONFIGURATION_ERROR, RunRecipe(executor));
	EXPECT_EQ(0u, executor.Commands().size());
	EXPECT_TRUE(fs::exists(params.ItemDir("101") / "lang.conf"));
	EXPECT_FALSE(fs::exists(params.ItemDir("102")));
	EXPECT_FALSE(fs::exists(params.ItemDir("103")));
	EXPECT_FALSE(fs::exists(params.pth_train));
	EXPECT_FALSE(fs::exists(params.pth_stage_markers / "0" / ".done"));
}

TEST_F(PipelineTest, FailedDataPreparation)
{
	Init({ "101", "102" }, { "--langs=101 102" });
	RecordingStepExecutor executor;
	executor.fail.insert("local/prepare_data.sh");
	EXPECT_EQ(BB_STEP_FAILURE, RunRecipe(executor));
	EXPECT_TRUE(fs::exists(params.pth_stage_markers / "0" / ".done"));
	EXPECT_FALSE(fs::exists(params.pth_stage_markers / "1" / ".done"));
	EXPECT_FALSE(fs::exists(params.ItemTrainDir("101") / ".done"));
}

TEST_F(PipelineTest, MalformedLexiconIsDataError)
{
	Init({ "101", "102" }, { "--langs=101 102", "--num-workers=1" });
	RecordingStepExecutor executor;
	executor.lexicons["102"] = "hello\th e l o\nbroken\n";
	EXPECT_EQ(BB_DATA_ERROR, RunRecipe(executor));
	EXPECT_TRUE(fs::exists(params.pth_stage_markers / "1" / ".done"));
	EXPECT_FALSE(fs::exists(params.pth_stage_markers / "2" / ".done"));
}

TEST_F(PipelineTest, ConflictingPronunciationsAreKept)
{
	Init({ "101", "102" }, { "--langs=101 102", "--subset-sizes=1 2 3" });
	RecordingStepExecutor executor;
	executor.lexicons["102"] = "hello\th a l o\nworld\tw o r l d\n<silence>\tSIL\n";
	ASSERT_EQ(BB_OK, RunRecipe(executor));
	EXPECT_EQ(string_vec({ "hello\t102: h a l o | 101: h e l o" }), ReadNonEmptyLines(params.pth_dict_universal / "pron_conflicts.txt"));
	string_vec lexicon = ReadNonEmptyLines(params.pth_dict_universal / "nonsilence_lexicon.txt");
	EXPECT_EQ(string_vec({ "hello\th a l o", "hello\th e l o", "world\tw o r l d" }), lexicon);
}

TEST_F(PipelineTest, ItemConfigurationIsRewritten)
{
	Init({ "101" }, { "--langs=101" });
	MarkerStateStore state(params.pth_project_base);
	RecordingStepExecutor executor;
	PipelineContext ctx(params, state, executor);
	ASSERT_EQ(BB_OK, SetupItemWorkspace(ctx, "101"));
	fs::path langconf(params.ItemDir("101") / "lang.conf");
	EXPECT_FALSE(fs::is_symlink(langconf));
	EXPECT_EQ("train_data_list=/export/babel/data/OtherLR-data/splits/101/train.LimitedLP.list\n", ReadFile(langconf));
}

TEST_F(PipelineTest, ItemConfigurationIsLinked)
{
	Init({ "101" }, { "--langs=101", "--lang-conf-rewrite-from=" });
	MarkerStateStore state(params.pth_project_base);
	RecordingStepExecutor executor;
	PipelineContext ctx(params, state, executor);
	ASSERT_EQ(BB_OK, SetupItemWorkspace(ctx, "101"));
	fs::path langconf(params.ItemDir("101") / "lang.conf");
	EXPECT_TRUE(fs::is_symlink(langconf));
	EXPECT_EQ("101-test-limitedLP.official.conf", fs::read_symlink(langconf).filename().string());

	//running it again keeps the workspace
	fs::remove(params.ItemDir("101") / ".done");
	EXPECT_EQ(BB_OK, SetupItemWorkspace(ctx, "101"));
	EXPECT_TRUE(fs::is_symlink(langconf));
}

TEST_F(PipelineTest, SharedResourceNotALink)
{
	Init({ "101" }, { "--langs=101" });
	fs::create_directories(params.ItemDir("101") / "steps");
	MarkerStateStore state(params.pth_project_base);
	RecordingStepExecutor executor;
	PipelineContext ctx(params, state, executor);
	EXPECT_EQ(BB_CONFIGURATION_ERROR, SetupItemWorkspace(ctx, "101"));
	EXPECT_FALSE(state.IsComplete("data/101"));
}
