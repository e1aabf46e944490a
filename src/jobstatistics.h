#ifndef JOBSTATISTICS_H
#define JOBSTATISTICS_H

#include <QVariantMap>

/**
 * Statistics of one processed image/mask pair
 *
 * A dry run does not evaluate any patch, its record carries -1 in every
 * field (see notComputed()).
 */
struct PairStatistics {
    int totalCoords;        // Candidate origins produced by the grid
    int kept;               // Origins surviving the coverage filter and sampling
    double coverageMean;    // Mean coverage over all evaluated candidates

    PairStatistics() :
        totalCoords(0),
        kept(0),
        coverageMean(0.0)
    {}

    static PairStatistics notComputed()
    {
        PairStatistics stats;
        stats.totalCoords = -1;
        stats.kept = -1;
        stats.coverageMean = -1.0;
        return stats;
    }

    bool isComputed() const { return totalCoords >= 0; }

    QVariantMap toVariantMap() const
    {
        QVariantMap map;
        map.insert("total_coords", totalCoords);
        map.insert("kept", kept);
        map.insert("coverage_mean", coverageMean);
        return map;
    }
};

/**
 * Cumulative statistics of one extraction job
 */
struct JobStatistics {
    int images;             // Image files found in the source image folder
    int pairs;              // Image/mask pairs found
    int processed;          // Pairs processed so far
    int patchesTotal;       // Patches written so far
    int keptLast;           // Patches written for the most recent pair
    PairStatistics lastPair;

    JobStatistics() :
        images(0),
        pairs(0),
        processed(0),
        patchesTotal(0),
        keptLast(0)
    {}

    void reset() { *this = JobStatistics(); }

    /**
     * Named counters, as shown by a statistics panel
     */
    QVariantMap toVariantMap() const
    {
        QVariantMap map;
        map.insert("images", images);
        map.insert("pairs", pairs);
        map.insert("processed", processed);
        map.insert("patches_total", patchesTotal);
        map.insert("kept_last", keptLast);
        map.insert("last_pair", lastPair.toVariantMap());
        return map;
    }
};

#endif // JOBSTATISTICS_H
