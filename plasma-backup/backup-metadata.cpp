// This is an open source non-commercial project. Dear PVS-Studio, please check it.
// PVS-Studio Static Code Analyzer for C, C++ and C#: http://www.viva64.com
//
// backup-metadata.cpp
//
#include "backup-metadata.hpp"

#include "enums.hpp"
#include "str-util.hpp"
#include "system-info.hpp"
#include "util.hpp"

#include <algorithm>

#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

namespace plasma_backup
{

    namespace pt = boost::property_tree;

    namespace
    {
        constexpr Category all_categories[]{ Category::KdeSettings,
                                             Category::AppConfigs,
                                             Category::Firefox,
                                             Category::Thunderbird,
                                             Category::UserDirs };

        std::wstring makePtreeErrorMessage(
            const std::wstring & action, const fs::path & path, const pt::ptree_error & ex)
        {
            return (
                L"Unable to " + action + L" \"" + path.wstring() + L"\"  {" +
                strutil::toWideString(ex.what()) + L"}");
        }
    } // namespace

    std::string makeTimestampString() { return makeLocalTimeString(timestamp_format); }

    bool writeMetadata(
        const fs::path & backupDir, const BackupMetadata & metadata, std::wstring & errorMessage)
    {
        errorMessage.clear();

        const fs::path metadataPath{ backupDir / metadata_filename };

        pt::ptree tree;
        tree.put("timestamp", metadata.timestamp);
        tree.put("hostname", metadata.hostname);
        tree.put("user", metadata.user);

        pt::ptree configTree;
        for (const Category category : all_categories)
        {
            configTree.put(toMetadataKey(category), metadata.categories.isSelected(category));
        }

        tree.add_child("config", configTree);
        tree.put("kde_version", metadata.kde_version);
        tree.put("os_version", metadata.os_version);

        try
        {
            pt::write_json(metadataPath.string(), tree);
        }
        catch (const pt::ptree_error & ex)
        {
            errorMessage = makePtreeErrorMessage(L"write the metadata file", metadataPath, ex);
            return false;
        }

        return true;
    }

    bool readMetadata(
        const fs::path & backupDir, BackupMetadata & metadata, std::wstring & errorMessage)
    {
        errorMessage.clear();

        const fs::path metadataPath{ backupDir / metadata_filename };

        pt::ptree tree;

        try
        {
            pt::read_json(metadataPath.string(), tree);
        }
        catch (const pt::ptree_error & ex)
        {
            errorMessage = makePtreeErrorMessage(L"read the metadata file", metadataPath, ex);
            return false;
        }

        metadata           = BackupMetadata();
        metadata.timestamp = tree.get<std::string>("timestamp", backupDir.filename().string());
        metadata.hostname  = tree.get<std::string>("hostname", unknown_str);
        metadata.user      = tree.get<std::string>("user", unknown_str);

        metadata.kde_version = tree.get<std::string>("kde_version", unknown_str);

        metadata.os_version = tree.get<std::string>(
            "os_version", tree.get<std::string>("fedora_version", unknown_str));

        metadata.categories = CategorySelection::none();
        if (const auto configTreeOpt{ tree.get_child_optional("config") }; configTreeOpt)
        {
            for (const Category category : all_categories)
            {
                metadata.categories.select(
                    category, configTreeOpt->get<bool>(toMetadataKey(category), false));
            }
        }

        return true;
    }

    BackupListingVec_t listBackups(const fs::path & backupPath, std::wstring & errorMessage)
    {
        errorMessage.clear();

        BackupListingVec_t listings;

        if (!isDirectoryIgnoringErrors(backupPath))
        {
            errorMessage = L"Backup location does not exist: " + backupPath.wstring();
            return listings;
        }

        ErrorCode_t errorCode;
        fs::directory_iterator dirIter(backupPath, errorCode);
        const fs::directory_iterator dirIterEnd;
        while (!errorCode && (dirIter != dirIterEnd))
        {
            const fs::path folderPath{ dirIter->path() };

            if (isDirectoryIgnoringErrors(folderPath) &&
                existsIgnoringErrors((folderPath / metadata_filename), false))
            {
                BackupListing listing;
                listing.path = folderPath;

                std::wstring readErrorMessage;
                listing.is_metadata_valid =
                    readMetadata(folderPath, listing.metadata, readErrorMessage);

                if (!listing.is_metadata_valid)
                {
                    listing.metadata             = BackupMetadata();
                    listing.metadata.timestamp   = folderPath.filename().string();
                    listing.metadata.hostname    = unknown_str;
                    listing.metadata.user        = unknown_str;
                    listing.metadata.kde_version = unknown_str;
                    listing.metadata.os_version  = unknown_str;
                    listing.metadata.categories  = CategorySelection::none();
                }

                listings.push_back(listing);
            }

            dirIter.increment(errorCode);
        }

        if (errorCode)
        {
            errorMessage = L"Unable to list everything in " + backupPath.wstring() + L"  {" +
                toString(errorCode) + L"}";
        }

        std::sort(
            std::begin(listings),
            std::end(listings),
            [](const BackupListing & A, const BackupListing & B) {
                if (A.metadata.timestamp != B.metadata.timestamp)
                {
                    return (A.metadata.timestamp > B.metadata.timestamp);
                }
                else
                {
                    return (A.path > B.path);
                }
            });

        return listings;
    }

} // namespace plasma_backup
