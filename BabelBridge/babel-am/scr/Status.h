/*
	Copyright 2017-present Zoltan Somogyi (AI-TOOLKIT), All Rights Reserved
	You may use this file only if you agree to the software license:
	AI-TOOLKIT Open Source Software License - Version 2.1 - February 22, 2018:
	https://ai-toolkit.blogspot.com/p/ai-toolkit-open-source-software-license.html.
	Also included with the source code distribution in AI-TOOLKIT-LICENSE.txt.
*/
#pragma once

/*
	Return values of the pipeline functions. As everywhere in the code 0 means success and a negative
	value means failure, so 'if (f() < 0)' keeps working; the value tells the kind of the failure.
	A failure is logged where it happens and the value is returned unchanged up to the stage runner.
*/
enum BabelStatus {
	BB_OK = 0,
	BB_ERROR = -1,					//generic I/O error of a helper function
	BB_CONFIGURATION_ERROR = -2,	//no matching item configuration, invalid option value
	BB_DATA_ERROR = -3,				//malformed lexicon entry, duplicate id after prefixing, silence lexicon mismatch
	BB_STEP_FAILURE = -4,			//an external toolkit step returned nonzero status
	BB_STATE_ERROR = -5				//an upstream artifact or marker is missing
};

inline const char * StatusName(int status)
{
	switch (status) {
	case BB_OK: return "OK";
	case BB_CONFIGURATION_ERROR: return "ConfigurationError";
	case BB_DATA_ERROR: return "DataError";
	case BB_STEP_FAILURE: return "StepFailure";
	case BB_STATE_ERROR: return "StateError";
	default: return "Error";
	}
}
