#include "library_info.hpp"
#include <memory>
#include <sstream>

const std::vector<RecordColumn<LibraryInfo>>& LibraryInfo::columns() {
    static const std::vector<RecordColumn<LibraryInfo>> kColumns = {
        {"OBJECT_COUNT", &LibraryInfo::objectCount},
        {"LIBRARY_SIZE", &LibraryInfo::librarySize},
        {"LIBRARY_SIZE_COMPLETE", &LibraryInfo::librarySizeComplete},
        {"LIBRARY_TYPE", &LibraryInfo::libraryType},
        {"TEXT_DESCRIPTION", &LibraryInfo::textDescription},
        {"IASP_NAME", &LibraryInfo::iaspName},
        {"IASP_NUMBER", &LibraryInfo::iaspNumber},
        {"CREATE_AUTHORITY", &LibraryInfo::createAuthority},
        {"OBJECT_AUDIT_CREATE", &LibraryInfo::objectAuditCreate},
        {"JOURNALED", &LibraryInfo::journaled},
        {"JOURNAL_LIBRARY", &LibraryInfo::journalLibrary},
        {"JOURNAL_NAME", &LibraryInfo::journalName},
        {"INHERIT_JOURNALING", &LibraryInfo::inheritJournaling},
        {"JOURNAL_INHERIT_RULES", &LibraryInfo::journalInheritRules},
        {"JOURNAL_START_TIMESTAMP", &LibraryInfo::journalStartTimestamp},
        {"APPLY_STARTING_RECEIVER_LIBRARY", &LibraryInfo::applyStartingReceiverLibrary},
        {"APPLY_STARTING_RECEIVER", &LibraryInfo::applyStartingReceiver},
        {"APPLY_STARTING_RECEIVER_ASP", &LibraryInfo::applyStartingReceiverAsp},
    };
    return kColumns;
}

const std::vector<RecordColumn<ObjectStatistics>>& ObjectStatistics::columns() {
    static const std::vector<RecordColumn<ObjectStatistics>> kColumns = {
        {"OBJNAME", &ObjectStatistics::objName},
        {"OBJTYPE", &ObjectStatistics::objType},
        {"OBJOWNER", &ObjectStatistics::objOwner},
        {"OBJDEFINER", &ObjectStatistics::objDefiner},
        {"OBJCREATED", &ObjectStatistics::objCreated},
        {"OBJSIZE", &ObjectStatistics::objSize},
        {"OBJTEXT", &ObjectStatistics::objText},
        {"OBJLONGNAME", &ObjectStatistics::objLongName},
        {"LAST_USED_TIMESTAMP", &ObjectStatistics::lastUsedTimestamp},
        {"LAST_USED_OBJECT", &ObjectStatistics::lastUsedObject},
        {"DAYS_USED_COUNT", &ObjectStatistics::daysUsedCount},
        {"LAST_RESET_TIMESTAMP", &ObjectStatistics::lastResetTimestamp},
        {"IASP_NUMBER", &ObjectStatistics::iaspNumber},
        {"IASP_NAME", &ObjectStatistics::iaspName},
        {"OBJATTRIBUTE", &ObjectStatistics::objAttribute},
        {"OBJLONGSCHEMA", &ObjectStatistics::objLongSchema},
        {"TEXT", &ObjectStatistics::text},
        {"SQL_OBJECT_TYPE", &ObjectStatistics::sqlObjectType},
        {"OBJLIB", &ObjectStatistics::objLib},
        {"CHANGE_TIMESTAMP", &ObjectStatistics::changeTimestamp},
        {"USER_CHANGED", &ObjectStatistics::userChanged},
        {"SOURCE_FILE", &ObjectStatistics::sourceFile},
        {"SOURCE_LIBRARY", &ObjectStatistics::sourceLibrary},
        {"SOURCE_MEMBER", &ObjectStatistics::sourceMember},
        {"SOURCE_TIMESTAMP", &ObjectStatistics::sourceTimestamp},
        {"CREATED_SYSTEM", &ObjectStatistics::createdSystem},
        {"CREATED_SYSTEM_VERSION", &ObjectStatistics::createdSystemVersion},
        {"LICENSED_PROGRAM", &ObjectStatistics::licensedProgram},
        {"LICENSED_PROGRAM_VERSION", &ObjectStatistics::licensedProgramVersion},
        {"COMPILER", &ObjectStatistics::compiler},
        {"COMPILER_VERSION", &ObjectStatistics::compilerVersion},
        {"OBJECT_CONTROL_LEVEL", &ObjectStatistics::objectControlLevel},
        {"BUILD_ID", &ObjectStatistics::buildId},
        {"PTF_NUMBER", &ObjectStatistics::ptfNumber},
        {"APAR_ID", &ObjectStatistics::aparId},
        {"USER_DEFINED_ATTRIBUTE", &ObjectStatistics::userDefinedAttribute},
        {"ALLOW_CHANGE_BY_PROGRAM", &ObjectStatistics::allowChangeByProgram},
        {"CHANGED_BY_PROGRAM", &ObjectStatistics::changedByProgram},
        {"COMPRESSED", &ObjectStatistics::compressed},
        {"PRIMARY_GROUP", &ObjectStatistics::primaryGroup},
        {"STORAGE_FREED", &ObjectStatistics::storageFreed},
        {"ASSOCIATED_SPACE_SIZE", &ObjectStatistics::associatedSpaceSize},
        {"OPTIMUM_SPACE_ALIGNMENT", &ObjectStatistics::optimumSpaceAlignment},
        {"OVERFLOW_STORAGE", &ObjectStatistics::overflowStorage},
        {"OBJECT_DOMAIN", &ObjectStatistics::objectDomain},
        {"OBJECT_AUDIT", &ObjectStatistics::objectAudit},
        {"OBJECT_SIGNED", &ObjectStatistics::objectSigned},
        {"SYSTEM_TRUSTED_SOURCE", &ObjectStatistics::systemTrustedSource},
        {"MULTIPLE_SIGNATURES", &ObjectStatistics::multipleSignatures},
        {"SAVE_TIMESTAMP", &ObjectStatistics::saveTimestamp},
        {"RESTORE_TIMESTAMP", &ObjectStatistics::restoreTimestamp},
        {"SAVE_WHILE_ACTIVE_TIMESTAMP", &ObjectStatistics::saveWhileActiveTimestamp},
        {"SAVE_COMMAND", &ObjectStatistics::saveCommand},
        {"SAVE_DEVICE", &ObjectStatistics::saveDevice},
        {"SAVE_FILE_NAME", &ObjectStatistics::saveFileName},
        {"SAVE_FILE_LIBRARY", &ObjectStatistics::saveFileLibrary},
        {"SAVE_VOLUME", &ObjectStatistics::saveVolume},
        {"SAVE_LABEL", &ObjectStatistics::saveLabel},
        {"SAVE_SEQUENCE_NUMBER", &ObjectStatistics::saveSequenceNumber},
        {"LAST_SAVE_SIZE", &ObjectStatistics::lastSaveSize},
        {"JOURNALED", &ObjectStatistics::journaled},
        {"JOURNAL_NAME", &ObjectStatistics::journalName},
        {"JOURNAL_LIBRARY", &ObjectStatistics::journalLibrary},
        {"JOURNAL_IMAGES", &ObjectStatistics::journalImages},
        {"OMIT_JOURNAL_ENTRY", &ObjectStatistics::omitJournalEntry},
        {"REMOTE_JOURNAL_FILTER", &ObjectStatistics::remoteJournalFilter},
        {"JOURNAL_START_TIMESTAMP", &ObjectStatistics::journalStartTimestamp},
        {"APPLY_STARTING_RECEIVER", &ObjectStatistics::applyStartingReceiver},
        {"APPLY_STARTING_RECEIVER_LIBRARY", &ObjectStatistics::applyStartingReceiverLibrary},
        {"AUTHORITY_COLLECTION_VALUE", &ObjectStatistics::authorityCollectionValue},
    };
    return kColumns;
}

const std::vector<RecordColumn<MemberStatistics>>& MemberStatistics::columns() {
    static const std::vector<RecordColumn<MemberStatistics>> kColumns = {
        {"TABLE_SCHEMA", &MemberStatistics::tableSchema},
        {"TABLE_NAME", &MemberStatistics::tableName},
        {"SYSTEM_TABLE_SCHEMA", &MemberStatistics::systemTableSchema},
        {"SYSTEM_TABLE_NAME", &MemberStatistics::systemTableName},
        {"SYSTEM_TABLE_MEMBER", &MemberStatistics::systemTableMember},
        {"SOURCE_TYPE", &MemberStatistics::sourceType},
        {"LAST_SOURCE_UPDATE_TIMESTAMP", &MemberStatistics::lastSourceUpdateTimestamp},
        {"TEXT_DESCRIPTION", &MemberStatistics::textDescription},
        {"CREATE_TIMESTAMP", &MemberStatistics::createTimestamp},
        {"LAST_CHANGE_TIMESTAMP", &MemberStatistics::lastChangeTimestamp},
        {"LAST_SAVE_TIMESTAMP", &MemberStatistics::lastSaveTimestamp},
        {"LAST_RESTORE_TIMESTAMP", &MemberStatistics::lastRestoreTimestamp},
        {"LAST_USED_TIMESTAMP", &MemberStatistics::lastUsedTimestamp},
        {"DAYS_USED_COUNT", &MemberStatistics::daysUsedCount},
        {"LAST_RESET_TIMESTAMP", &MemberStatistics::lastResetTimestamp},
        {"TABLE_PARTITION", &MemberStatistics::tablePartition},
        {"PARTITION_TYPE", &MemberStatistics::partitionType},
        {"PARTITION_NUMBER", &MemberStatistics::partitionNumber},
        {"NUMBER_DISTRIBUTED_PARTITIONS", &MemberStatistics::numberDistributedPartitions},
        {"NUMBER_PARTITIONING_KEYS", &MemberStatistics::numberPartitioningKeys},
        {"PARTITIONING_KEYS", &MemberStatistics::partitioningKeys},
        {"LOWINCLUSIVE", &MemberStatistics::lowInclusive},
        {"LOWVALUE", &MemberStatistics::lowValue},
        {"HIGHINCLUSIVE", &MemberStatistics::highInclusive},
        {"HIGHVALUE", &MemberStatistics::highValue},
        {"NUMBER_ROWS", &MemberStatistics::numberRows},
        {"NUMBER_PAGES", &MemberStatistics::numberPages},
        {"OVERFLOW", &MemberStatistics::overflow},
        {"AVGROWSIZE", &MemberStatistics::avgRowSize},
        {"NUMBER_DELETED_ROWS", &MemberStatistics::numberDeletedRows},
        {"DATA_SIZE", &MemberStatistics::dataSize},
        {"VARIABLE_LENGTH_SIZE", &MemberStatistics::variableLengthSize},
        {"VARIABLE_LENGTH_SEGMENTS", &MemberStatistics::variableLengthSegments},
        {"COLUMN_STATS_SIZE", &MemberStatistics::columnStatsSize},
        {"MAINTAINED_TEMPORARY_INDEX_SIZE", &MemberStatistics::maintainedTemporaryIndexSize},
        {"NUMBER_DISTINCT_INDEXES", &MemberStatistics::numberDistinctIndexes},
        {"OPEN_OPERATIONS", &MemberStatistics::openOperations},
        {"CLOSE_OPERATIONS", &MemberStatistics::closeOperations},
        {"INSERT_OPERATIONS", &MemberStatistics::insertOperations},
        {"BLOCKED_INSERT_OPERATIONS", &MemberStatistics::blockedInsertOperations},
        {"BLOCKED_INSERT_ROWS", &MemberStatistics::blockedInsertRows},
        {"UPDATE_OPERATIONS", &MemberStatistics::updateOperations},
        {"DELETE_OPERATIONS", &MemberStatistics::deleteOperations},
        {"CLEAR_OPERATIONS", &MemberStatistics::clearOperations},
        {"COPY_OPERATIONS", &MemberStatistics::copyOperations},
        {"REORGANIZE_OPERATIONS", &MemberStatistics::reorganizeOperations},
        {"INDEX_BUILDS", &MemberStatistics::indexBuilds},
        {"LOGICAL_READS", &MemberStatistics::logicalReads},
        {"PHYSICAL_READS", &MemberStatistics::physicalReads},
        {"SEQUENTIAL_READS", &MemberStatistics::sequentialReads},
        {"RANDOM_READS", &MemberStatistics::randomReads},
        {"NEXT_IDENTITY_VALUE", &MemberStatistics::nextIdentityValue},
        {"KEEP_IN_MEMORY", &MemberStatistics::keepInMemory},
        {"MEDIA_PREFERENCE", &MemberStatistics::mediaPreference},
        {"VOLATILE", &MemberStatistics::isVolatile},
        {"PARTIAL_TRANSACTION", &MemberStatistics::partialTransaction},
        {"APPLY_STARTING_RECEIVER_LIBRARY", &MemberStatistics::applyStartingReceiverLibrary},
        {"APPLY_STARTING_RECEIVER", &MemberStatistics::applyStartingReceiver},
    };
    return kColumns;
}

std::string writeJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "    ";
    std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    std::ostringstream out;
    writer->write(value, &out);
    return out.str();
}
