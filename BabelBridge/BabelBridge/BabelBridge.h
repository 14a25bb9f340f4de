/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/
#pragma once

#include "babel-am/utility/TwinLoggerMT.h"
#include "babel-am/utility/Utility.h"
#include "babel-am/utility/Utility2.h"
#include "babel-am/utility/strvec2arg.h"
#include "babel-am/scr/Status.h"
#include "babel-am/scr/Params.h"
#include "babel-am/scr/ConfigMatcher.h"
#include "babel-am/scr/StateStore.h"
#include "babel-am/scr/StepExecutor.h"
#include "babel-am/scr/StageRunner.h"
#include "babel-am/scr/Pipeline.h"
#include "babel-am/scr/babel_scr.h"
