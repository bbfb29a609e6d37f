#ifndef H_LOGSHIP_TYPES_V0
#define H_LOGSHIP_TYPES_V0

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C"
{
#endif

    typedef enum
    {
        LogShipStatusCode_Success = 0,
        LogShipStatusCode_InvalidArgument,
        LogShipStatusCode_InternalError,
        LogShipStatusCode_OutOfMemory,
        LogShipStatusCode_UploadError,
        LogShipStatusCode_CompressionError,
        LogShipStatusCode_InvalidSettings,
        LogShipStatusCodeCount,
    } LogShipStatusCode;

    typedef enum
    {
        LogShipLogLevel_Debug,
        LogShipLogLevel_Info,
        LogShipLogLevel_Warning,
        LogShipLogLevel_Error,
        LogShipLogLevel_None,
        LogShipLogLevelCount
    } LogShipLogLevel;

    /**
     * @brief S3 settings for streaming logs.
     * @note An empty endpoint addresses AWS S3 directly.
     */
    typedef struct
    {
        const char* endpoint;          /**< URI of the S3 service, e.g. http://localhost:9000 */
        const char* bucket_name;       /**< Name of the bucket to put objects in. Required. */
        const char* access_key_id;     /**< Access key ID */
        const char* secret_access_key; /**< Secret access key */
        const char* region;            /**< Optional region */
    } LogShipS3Settings;

    /**
     * @brief A single object tag. Tags are attached to every uploaded object.
     */
    typedef struct
    {
        const char* key;
        const char* value;
    } LogShipTag;

    /**
     * @brief Called on the flush thread whenever a flush attempt fails.
     * @param message Diagnostic message describing the failure.
     * @param user_data The pointer supplied with the callback.
     */
    typedef void (*LogShipErrorCallback)(const char* message, void* user_data);

    /**
     * @brief Called on the flush thread when a requested flush completes.
     * @param status LogShipStatusCode_Success, or the failure kind.
     * @param object_key The key the payload was put under.
     * @param etag The etag returned by the store. Empty on failure.
     * @param user_data The pointer supplied with the callback.
     */
    typedef void (*LogShipFlushCallback)(LogShipStatusCode status,
                                         const char* object_key,
                                         const char* etag,
                                         void* user_data);

#ifdef __cplusplus
}
#endif

#endif // H_LOGSHIP_TYPES_V0
