#ifndef H_PARTSINK_TYPES_V0
#define H_PARTSINK_TYPES_V0

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        PartsinkLogLevel_Debug,
        PartsinkLogLevel_Info,
        PartsinkLogLevel_Warning,
        PartsinkLogLevel_Error,
        PartsinkLogLevel_None,
        PartsinkLogLevelCount
    } PartsinkLogLevel;

    typedef enum
    {
        PartsinkSessionPhase_Unopened = 0,
        PartsinkSessionPhase_Open,
        PartsinkSessionPhase_Completing,
        PartsinkSessionPhase_Completed,
        PartsinkSessionPhase_Aborted,
        PartsinkSessionPhaseCount
    } PartsinkSessionPhase;

#ifdef __cplusplus
}
#endif

#endif // H_PARTSINK_TYPES_V0
