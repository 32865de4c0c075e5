/**
 * @file library_info.hpp
 * @brief Record types for the library and object metadata queries.
 *
 * Each query has a fixed column layout. Result rows are mapped onto the records by
 * position, and every value is kept as the text the driver returned (NULL stays empty).
 * The column tables also give the JSON key of each field.
 */

#ifndef LIBRARY_INFO_HPP
#define LIBRARY_INFO_HPP

#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include <json/json.h>
#include "command_channel.hpp"

/**
 * @brief Binds a result column name to a record field.
 */
template <typename Record>
struct RecordColumn {
    const char* name;
    std::optional<std::string> Record::*field;
};

/**
 * @brief One row of QSYS2.LIBRARY_INFO.
 */
struct LibraryInfo {
    std::optional<std::string> objectCount;
    std::optional<std::string> librarySize;
    std::optional<std::string> librarySizeComplete;
    std::optional<std::string> libraryType;
    std::optional<std::string> textDescription;
    std::optional<std::string> iaspName;
    std::optional<std::string> iaspNumber;
    std::optional<std::string> createAuthority;
    std::optional<std::string> objectAuditCreate;
    std::optional<std::string> journaled;
    std::optional<std::string> journalLibrary;
    std::optional<std::string> journalName;
    std::optional<std::string> inheritJournaling;
    std::optional<std::string> journalInheritRules;
    std::optional<std::string> journalStartTimestamp;
    std::optional<std::string> applyStartingReceiverLibrary;
    std::optional<std::string> applyStartingReceiver;
    std::optional<std::string> applyStartingReceiverAsp;

    static const std::vector<RecordColumn<LibraryInfo>>& columns();
};

/**
 * @brief One row of QSYS2.OBJECT_STATISTICS(<lib>, '*ALL').
 */
struct ObjectStatistics {
    std::optional<std::string> objName;
    std::optional<std::string> objType;
    std::optional<std::string> objOwner;
    std::optional<std::string> objDefiner;
    std::optional<std::string> objCreated;
    std::optional<std::string> objSize;
    std::optional<std::string> objText;
    std::optional<std::string> objLongName;
    std::optional<std::string> lastUsedTimestamp;
    std::optional<std::string> lastUsedObject;
    std::optional<std::string> daysUsedCount;
    std::optional<std::string> lastResetTimestamp;
    std::optional<std::string> iaspNumber;
    std::optional<std::string> iaspName;
    std::optional<std::string> objAttribute;
    std::optional<std::string> objLongSchema;
    std::optional<std::string> text;
    std::optional<std::string> sqlObjectType;
    std::optional<std::string> objLib;
    std::optional<std::string> changeTimestamp;
    std::optional<std::string> userChanged;
    std::optional<std::string> sourceFile;
    std::optional<std::string> sourceLibrary;
    std::optional<std::string> sourceMember;
    std::optional<std::string> sourceTimestamp;
    std::optional<std::string> createdSystem;
    std::optional<std::string> createdSystemVersion;
    std::optional<std::string> licensedProgram;
    std::optional<std::string> licensedProgramVersion;
    std::optional<std::string> compiler;
    std::optional<std::string> compilerVersion;
    std::optional<std::string> objectControlLevel;
    std::optional<std::string> buildId;
    std::optional<std::string> ptfNumber;
    std::optional<std::string> aparId;
    std::optional<std::string> userDefinedAttribute;
    std::optional<std::string> allowChangeByProgram;
    std::optional<std::string> changedByProgram;
    std::optional<std::string> compressed;
    std::optional<std::string> primaryGroup;
    std::optional<std::string> storageFreed;
    std::optional<std::string> associatedSpaceSize;
    std::optional<std::string> optimumSpaceAlignment;
    std::optional<std::string> overflowStorage;
    std::optional<std::string> objectDomain;
    std::optional<std::string> objectAudit;
    std::optional<std::string> objectSigned;
    std::optional<std::string> systemTrustedSource;
    std::optional<std::string> multipleSignatures;
    std::optional<std::string> saveTimestamp;
    std::optional<std::string> restoreTimestamp;
    std::optional<std::string> saveWhileActiveTimestamp;
    std::optional<std::string> saveCommand;
    std::optional<std::string> saveDevice;
    std::optional<std::string> saveFileName;
    std::optional<std::string> saveFileLibrary;
    std::optional<std::string> saveVolume;
    std::optional<std::string> saveLabel;
    std::optional<std::string> saveSequenceNumber;
    std::optional<std::string> lastSaveSize;
    std::optional<std::string> journaled;
    std::optional<std::string> journalName;
    std::optional<std::string> journalLibrary;
    std::optional<std::string> journalImages;
    std::optional<std::string> omitJournalEntry;
    std::optional<std::string> remoteJournalFilter;
    std::optional<std::string> journalStartTimestamp;
    std::optional<std::string> applyStartingReceiver;
    std::optional<std::string> applyStartingReceiverLibrary;
    std::optional<std::string> authorityCollectionValue;

    static const std::vector<RecordColumn<ObjectStatistics>>& columns();
};

/**
 * @brief One source member row of QSYS2.SYSMEMBERSTAT.
 */
struct MemberStatistics {
    std::optional<std::string> tableSchema;
    std::optional<std::string> tableName;
    std::optional<std::string> systemTableSchema;
    std::optional<std::string> systemTableName;
    std::optional<std::string> systemTableMember;
    std::optional<std::string> sourceType;
    std::optional<std::string> lastSourceUpdateTimestamp;
    std::optional<std::string> textDescription;
    std::optional<std::string> createTimestamp;
    std::optional<std::string> lastChangeTimestamp;
    std::optional<std::string> lastSaveTimestamp;
    std::optional<std::string> lastRestoreTimestamp;
    std::optional<std::string> lastUsedTimestamp;
    std::optional<std::string> daysUsedCount;
    std::optional<std::string> lastResetTimestamp;
    std::optional<std::string> tablePartition;
    std::optional<std::string> partitionType;
    std::optional<std::string> partitionNumber;
    std::optional<std::string> numberDistributedPartitions;
    std::optional<std::string> numberPartitioningKeys;
    std::optional<std::string> partitioningKeys;
    std::optional<std::string> lowInclusive;
    std::optional<std::string> lowValue;
    std::optional<std::string> highInclusive;
    std::optional<std::string> highValue;
    std::optional<std::string> numberRows;
    std::optional<std::string> numberPages;
    std::optional<std::string> overflow;
    std::optional<std::string> avgRowSize;
    std::optional<std::string> numberDeletedRows;
    std::optional<std::string> dataSize;
    std::optional<std::string> variableLengthSize;
    std::optional<std::string> variableLengthSegments;
    std::optional<std::string> columnStatsSize;
    std::optional<std::string> maintainedTemporaryIndexSize;
    std::optional<std::string> numberDistinctIndexes;
    std::optional<std::string> openOperations;
    std::optional<std::string> closeOperations;
    std::optional<std::string> insertOperations;
    std::optional<std::string> blockedInsertOperations;
    std::optional<std::string> blockedInsertRows;
    std::optional<std::string> updateOperations;
    std::optional<std::string> deleteOperations;
    std::optional<std::string> clearOperations;
    std::optional<std::string> copyOperations;
    std::optional<std::string> reorganizeOperations;
    std::optional<std::string> indexBuilds;
    std::optional<std::string> logicalReads;
    std::optional<std::string> physicalReads;
    std::optional<std::string> sequentialReads;
    std::optional<std::string> randomReads;
    std::optional<std::string> nextIdentityValue;
    std::optional<std::string> keepInMemory;
    std::optional<std::string> mediaPreference;
    std::optional<std::string> isVolatile;
    std::optional<std::string> partialTransaction;
    std::optional<std::string> applyStartingReceiverLibrary;
    std::optional<std::string> applyStartingReceiver;

    static const std::vector<RecordColumn<MemberStatistics>>& columns();
};
/**
 * @brief Assigns the values of a row to the record fields by position.
 *
 * Extra values are ignored and missing ones stay empty.
 */
template <typename Record>
Record recordFromRow(const ResultSet::Row& row) {
    Record record;
    const auto& columns = Record::columns();
    std::size_t count = std::min(row.size(), columns.size());
    for (std::size_t i = 0; i < count; ++i) {
        record.*(columns[i].field) = row[i];
    }
    return record;
}

template <typename Record>
std::vector<Record> recordsFromResult(const ResultSet& result) {
    std::vector<Record> records;
    records.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        records.push_back(recordFromRow<Record>(row));
    }
    return records;
}

/**
 * @brief Converts a record to a JSON object keyed by column name, NULL values as null.
 */
template <typename Record>
Json::Value recordToJson(const Record& record) {
    Json::Value object(Json::objectValue);
    for (const auto& column : Record::columns()) {
        const auto& value = record.*(column.field);
        object[column.name] = value ? Json::Value(*value) : Json::Value(Json::nullValue);
    }
    return object;
}

template <typename Record>
Json::Value recordsToJson(const std::vector<Record>& records) {
    Json::Value array(Json::arrayValue);
    for (const auto& record : records) {
        array.append(recordToJson(record));
    }
    return array;
}

/**
 * @brief Serializes a JSON document with 4-space indentation.
 */
std::string writeJson(const Json::Value& value);

#endif // LIBRARY_INFO_HPP
